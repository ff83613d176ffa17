#ifndef SHARDCACHE_H
#define SHARDCACHE_H

#include "status.h"
#include "options.h"
#include "entry.h"
#include "blob_store.h"
#include "shard_router.h"

#endif
