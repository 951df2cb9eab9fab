#pragma once

#include <datapod/datapod.hpp>
#include <stakeit/common/error.hpp>
#include <stakeit/common/types.hpp>

namespace stakeit::ledger {

    /// Monotonic block-height oracle supplied by the host chain
    class IBlockClock {
      public:
        virtual ~IBlockClock() = default;

        /// Current block height; never decreases between calls
        virtual BlockHeight blockHeight() const = 0;
    };

    /// Manually driven clock for hosts without a live chain (tests, simulations)
    class ManualClock : public IBlockClock {
      public:
        inline explicit ManualClock(BlockHeight start = 0) : height_(start) {}

        inline BlockHeight blockHeight() const override { return height_; }

        /// Mine `blocks` empty blocks
        inline dp::Result<void, dp::Error> advance(BlockHeight blocks = 1) {
            if (height_ + blocks < height_) {
                return dp::Result<void, dp::Error>::err(invalid_parameter("Block height overflow"));
            }
            height_ += blocks;
            return dp::Result<void, dp::Error>::ok();
        }

        /// Jump to an absolute height (never backwards)
        inline dp::Result<void, dp::Error> setHeight(BlockHeight height) {
            if (height < height_) {
                return dp::Result<void, dp::Error>::err(invalid_parameter("Block height cannot move backwards"));
            }
            height_ = height;
            return dp::Result<void, dp::Error>::ok();
        }

      private:
        BlockHeight height_;
    };

} // namespace stakeit::ledger
