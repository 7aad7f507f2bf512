#pragma once

#include <iocoro/expected.hpp>

#include <system_error>

namespace methodxml {

using iocoro::expected;
using iocoro::unexpect;
using iocoro::unexpect_t;
using iocoro::unexpected;

/// Return type of the fallible decoding helpers.
template <typename T>
using result = expected<T, std::error_code>;

}  // namespace methodxml
