#pragma once

#include <exception>

#include "market/protocol/v1/types.pb.h"

namespace market::util {

market::protocol::v1::ErrorCode ToErrorCode(const std::exception& e);

} // namespace market::util
