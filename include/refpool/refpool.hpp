#pragma once

#include "refpool/api/factory.hpp"
#include "refpool/api/status.hpp"
#include "refpool/api/version.hpp"
#include "refpool/json/i_json.hpp"
#include "refpool/log/ilog_manager.hpp"
#include "refpool/log/log_manager.hpp"
#include "refpool/memory/i_global_allocator.hpp"
#include "refpool/memory/iallocator.hpp"
#include "refpool/pool/fake_pool.hpp"
#include "refpool/pool/pool.hpp"
#include "refpool/pool/pool_box.hpp"
#include "refpool/pool/pool_options.hpp"
#include "refpool/pool/pool_ref.hpp"
#include "refpool/pool/pool_traits.hpp"
#include "refpool/sync/sync_type.hpp"

namespace refpool {

using pool::Pool;
using pool::PoolBox;
using pool::PoolRef;
using pool::SyncPool;
using pool::SyncPoolBox;
using pool::SyncPoolRef;
using sync::PoolSync;
using sync::PoolUnsync;

}  // namespace refpool
