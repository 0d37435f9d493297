#pragma once

namespace asyncrw {

template <typename R>
class Task;

} // namespace asyncrw
