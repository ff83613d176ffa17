#include "row.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <limits>

namespace ShardCache
{
    static constexpr uint8_t kRowVersion = 1;
    static constexpr uint8_t kHasExpire = 1 << 0;
    static constexpr uint8_t kHasTag = 1 << 1;

    namespace
    {
        void put_fixed32(std::string *dst, uint32_t value)
        {
            for (int i = 0; i < 4; i++)
            {
                dst->push_back(static_cast<char>((value >> (8 * i)) & 0xff));
            }
        }

        void put_fixed64(std::string *dst, uint64_t value)
        {
            for (int i = 0; i < 8; i++)
            {
                dst->push_back(static_cast<char>((value >> (8 * i)) & 0xff));
            }
        }

        // Big endian so that index keys sort by value.
        void put_big_endian(std::string *dst, uint64_t value, int width)
        {
            for (int i = width - 1; i >= 0; i--)
            {
                dst->push_back(static_cast<char>((value >> (8 * i)) & 0xff));
            }
        }

        class Reader
        {
        public:
            explicit Reader(std::string_view input) : input_(input) {}

            bool u8(uint8_t *value)
            {
                if (input_.size() < 1)
                {
                    return false;
                }
                *value = static_cast<uint8_t>(input_[0]);
                input_.remove_prefix(1);
                return true;
            }

            bool fixed32(uint32_t *value)
            {
                if (input_.size() < 4)
                {
                    return false;
                }
                *value = 0;
                for (int i = 0; i < 4; i++)
                {
                    *value |= static_cast<uint32_t>(static_cast<uint8_t>(input_[i])) << (8 * i);
                }
                input_.remove_prefix(4);
                return true;
            }

            bool fixed64(uint64_t *value)
            {
                if (input_.size() < 8)
                {
                    return false;
                }
                *value = 0;
                for (int i = 0; i < 8; i++)
                {
                    *value |= static_cast<uint64_t>(static_cast<uint8_t>(input_[i])) << (8 * i);
                }
                input_.remove_prefix(8);
                return true;
            }

            bool bytes(size_t len, std::string *value)
            {
                if (input_.size() < len)
                {
                    return false;
                }
                value->assign(input_.data(), len);
                input_.remove_prefix(len);
                return true;
            }

            std::string_view rest() const { return input_; }

        private:
            std::string_view input_;
        };
    }

    std::string entry_key(std::string_view key)
    {
        std::string result = kEntryPrefix;
        result.append(key);
        return result;
    }

    std::string expiry_key(int64_t expire_us, std::string_view key)
    {
        std::string result = kExpiryPrefix;
        put_big_endian(&result, static_cast<uint64_t>(std::max<int64_t>(expire_us, 0)), 8);
        result.append(key);
        return result;
    }

    int64_t expiry_key_time(std::string_view expiry_key)
    {
        uint64_t value = 0;
        auto encoded = expiry_key.substr(kExpiryPrefix.size(), 8);
        for (unsigned char c : encoded)
        {
            value = (value << 8) | c;
        }
        return static_cast<int64_t>(value);
    }

    std::string tag_prefix(std::string_view tag)
    {
        std::string result = kTagPrefix;
        put_big_endian(&result, tag.size(), 4);
        result.append(tag);
        return result;
    }

    std::string tag_key(std::string_view tag, std::string_view key)
    {
        std::string result = tag_prefix(tag);
        result.append(key);
        return result;
    }

    std::string prefix_end(std::string prefix)
    {
        while (!prefix.empty())
        {
            auto &last = prefix.back();
            if (static_cast<uint8_t>(last) != 0xff)
            {
                last = static_cast<char>(static_cast<uint8_t>(last) + 1);
                return prefix;
            }
            prefix.pop_back();
        }
        return prefix;
    }

    int64_t now_micros()
    {
        return std::chrono::duration_cast<std::chrono::microseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // The offset is clamped to a quarter of the int64 range on either side,
    // so the sum cannot overflow. NaN counts as 0.
    int64_t expire_micros(double ttl, int64_t now_us)
    {
        constexpr double kMax = static_cast<double>(std::numeric_limits<int64_t>::max() / 4);
        double delta = ttl * 1e6;
        if (std::isnan(delta))
        {
            delta = 0;
        }
        delta = std::clamp(delta, -kMax, kMax);
        return now_us + static_cast<int64_t>(std::llround(delta));
    }

    void Row::FillInfo(EntryInfo *info) const
    {
        if (expire_us)
        {
            info->expire_time = static_cast<double>(*expire_us) / 1e6;
        }
        else
        {
            info->expire_time.reset();
        }
        info->tag = tag;
        info->size = size;
    }

    std::string Row::Encode() const
    {
        std::string result;
        uint8_t flags = 0;
        if (expire_us)
        {
            flags |= kHasExpire;
        }
        if (tag)
        {
            flags |= kHasTag;
        }
        result.push_back(static_cast<char>(kRowVersion));
        result.push_back(static_cast<char>(kind));
        result.push_back(static_cast<char>(flags));
        put_fixed64(&result, static_cast<uint64_t>(store_us));
        put_fixed64(&result, size);
        if (expire_us)
        {
            put_fixed64(&result, static_cast<uint64_t>(*expire_us));
        }
        if (tag)
        {
            put_fixed32(&result, static_cast<uint32_t>(tag->size()));
            result.append(*tag);
        }
        switch (kind)
        {
        case ValueKind::kInteger:
            put_fixed64(&result, static_cast<uint64_t>(integer));
            break;
        case ValueKind::kReal:
        {
            uint64_t bits;
            static_assert(sizeof(bits) == sizeof(real));
            memcpy(&bits, &real, sizeof(bits));
            put_fixed64(&result, bits);
            break;
        }
        case ValueKind::kBytes:
        case ValueKind::kBlob:
            result.append(data);
            break;
        }
        return result;
    }

    Status Row::Decode(std::string_view input, Row *row)
    {
        Reader reader(input);
        uint8_t version, kind, flags;
        uint64_t store_us, size;
        if (!reader.u8(&version) || !reader.u8(&kind) || !reader.u8(&flags) ||
            !reader.fixed64(&store_us) || !reader.fixed64(&size))
        {
            return Status::Corruption("truncated row header");
        }
        if (version != kRowVersion)
        {
            return Status::Corruption("unknown row version " + std::to_string(version));
        }
        if (kind < static_cast<uint8_t>(ValueKind::kInteger) || kind > static_cast<uint8_t>(ValueKind::kBlob))
        {
            return Status::Corruption("unknown value kind " + std::to_string(kind));
        }
        row->kind = static_cast<ValueKind>(kind);
        row->store_us = static_cast<int64_t>(store_us);
        row->size = size;
        row->expire_us.reset();
        row->tag.reset();
        if (flags & kHasExpire)
        {
            uint64_t expire_us;
            if (!reader.fixed64(&expire_us))
            {
                return Status::Corruption("truncated expire time");
            }
            row->expire_us = static_cast<int64_t>(expire_us);
        }
        if (flags & kHasTag)
        {
            uint32_t tag_len;
            std::string tag;
            if (!reader.fixed32(&tag_len) || !reader.bytes(tag_len, &tag))
            {
                return Status::Corruption("truncated tag");
            }
            row->tag = std::move(tag);
        }
        switch (row->kind)
        {
        case ValueKind::kInteger:
        {
            uint64_t integer;
            if (!reader.fixed64(&integer))
            {
                return Status::Corruption("truncated integer");
            }
            row->integer = static_cast<int64_t>(integer);
            break;
        }
        case ValueKind::kReal:
        {
            uint64_t bits;
            if (!reader.fixed64(&bits))
            {
                return Status::Corruption("truncated real");
            }
            memcpy(&row->real, &bits, sizeof(bits));
            break;
        }
        case ValueKind::kBytes:
        case ValueKind::kBlob:
            row->data.assign(reader.rest());
            break;
        }
        return Status::OK();
    }
}
