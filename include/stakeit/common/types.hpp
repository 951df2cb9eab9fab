#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace stakeit {

    /// Identity of an account holder (wallet address, participant id, ...)
    using Principal = std::string;

    using MarketId = dp::u64;
    using BlockHeight = dp::u64;
    using Amount = dp::u64;

} // namespace stakeit
