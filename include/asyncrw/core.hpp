#pragma once

#include "core/handle.hpp"
#include "core/stop.hpp"
#include "core/callback.hpp"
#include "core/executor.hpp"
#include "core/awaitable.hpp"
#include "core/promise_base.hpp"
#include "core/promise.hpp"
#include "core/task.hpp"
#include "core/promise.inl.hpp"
#include "core/handle.inl.hpp"
#include "core/executor.inl.hpp"
#include "core/waker.hpp"
