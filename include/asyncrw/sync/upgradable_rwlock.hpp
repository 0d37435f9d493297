#pragma once

#include "rwlock.hpp"

#include <boost/thread/shared_mutex.hpp>

namespace asyncrw {

/// Asynchronous counterpart of boost::upgrade_mutex.
using AsyncUpgradeMutex = AsyncRawRwLock<boost::upgrade_mutex>;

/// RwLock which also hands out upgradable read access.
template <typename T>
using UpgradableRwLock = RwLock<T, AsyncUpgradeMutex>;

} // namespace asyncrw
