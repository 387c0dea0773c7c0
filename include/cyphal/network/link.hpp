#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <linux/can.h>
#include <wirebit/can/can_endpoint.hpp>

namespace cyphal {
    namespace network {

        // ─── Link driver collaborator ───────────────────────────────────────────────
        // Both calls must return immediately. receive() yields nullopt when nothing
        // is pending; transmit() reports LinkBusy when the link cannot take a frame.
        class LinkDriver {
          public:
            virtual ~LinkDriver() = default;

            virtual dp::Optional<CanFrame> receive() = 0;
            virtual Result<void> transmit(const CanFrame &frame) = 0;

            virtual u8 mtu() const noexcept { return CAN_CLASSIC_MTU; }
        };

        // ─── Classic CAN over a wirebit endpoint ────────────────────────────────────
        class WirebitLink : public LinkDriver {
            wirebit::CanEndpoint &endpoint_;
            InterfaceId iface_;

          public:
            WirebitLink(wirebit::CanEndpoint &endpoint, InterfaceId iface) : endpoint_(endpoint), iface_(iface) {}

            dp::Optional<CanFrame> receive() override {
                while (true) {
                    can_frame cf;
                    auto result = endpoint_.recv_can(cf);
                    if (!result.is_ok()) {
                        return dp::nullopt;
                    }
                    // Cyphal only uses 29-bit data frames
                    if (!(cf.can_id & CAN_EFF_FLAG) || (cf.can_id & (CAN_RTR_FLAG | CAN_ERR_FLAG))) {
                        echo::category("cyphal.node").trace("skipping non-extended frame on iface ", iface_);
                        continue;
                    }
                    return from_can_frame(cf, iface_);
                }
            }

            Result<void> transmit(const CanFrame &frame) override {
                if (frame.length > CAN_CLASSIC_MTU) {
                    return Result<void>::err(Error::invalid_argument("frame exceeds classic CAN payload"));
                }
                can_frame cf = to_can_frame(frame);
                auto result = endpoint_.send_can(cf);
                if (!result.is_ok()) {
                    return Result<void>::err(Error::link_busy());
                }
                return {};
            }

            InterfaceId iface() const noexcept { return iface_; }

            // ─── Frame conversion helpers ───────────────────────────────────────────
            static can_frame to_can_frame(const CanFrame &frame) {
                can_frame cf = {};
                cf.can_id = (frame.id.raw & CAN_EXT_ID_MASK) | CAN_EFF_FLAG;
                cf.can_dlc = frame.length;
                for (u8 i = 0; i < frame.length && i < CAN_CLASSIC_MTU; ++i) {
                    cf.data[i] = frame.data[i];
                }
                return cf;
            }

            static CanFrame from_can_frame(const can_frame &cf, InterfaceId iface) {
                u8 len = cf.can_dlc > CAN_CLASSIC_MTU ? CAN_CLASSIC_MTU : cf.can_dlc;
                return CanFrame(cf.can_id & CAN_EFF_MASK, cf.data, len, 0, iface);
            }
        };

    } // namespace network
    using namespace network;
} // namespace cyphal
