#pragma once

#include "core.hpp"
#include "executors/serial_executor.hpp"
#include "executors/thread_pool_executor.hpp"
#include "sleep.hpp"
#include "sync/lockable.hpp"
#include "sync/raw_rwlock.hpp"
#include "sync/wait.hpp"
#include "sync/rwlock.hpp"
#include "sync/upgradable_rwlock.hpp"
