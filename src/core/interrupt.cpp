#include "interrupt.h"

#include "common/asserts.h"
#include "common/log.h"

LOG_CHANNEL(IRQ);

InterruptController::InterruptController(Processor processor) : processor(processor) {}

void InterruptController::Reset() {
    master_enable.value = 0;
    enable = 0;
    request = 0;
}

void InterruptController::Request(IRQ irq) {
    request |= static_cast<u32>(irq);
    LogTrace("{} requested {} interrupt", ProcessorName(processor), GetInterruptName(irq));
}

bool InterruptController::Pending() const {
    return master_enable.enabled && (enable & request) != 0;
}

u8 InterruptController::Read(u32 address) const {
    const u32 byte = address & 0x3;

    switch (address & ~0x3) {
        case IME_ADDRESS: return ReadByte(master_enable.value, byte);
        case IE_ADDRESS: return ReadByte(enable, byte);
        case IF_ADDRESS: return ReadByte(request, byte);
    }

    Panic("Invalid interrupt register read 0x{:08X}", address);
}

void InterruptController::Write(u32 address, u8 value) {
    const u32 shift = 8 * (address & 0x3);
    const u32 lane_mask = 0xFFu << shift;

    switch (address & ~0x3) {
        case IME_ADDRESS:
            // only bit 0 is writable
            if (shift == 0) master_enable.value = value & 0x1;
            return;
        case IE_ADDRESS:
            enable = (enable & ~lane_mask) | (static_cast<u32>(value) << shift);
            return;
        case IF_ADDRESS: {
            // writing 1 acknowledges the request
            const u32 old_request = request;
            request &= ~(static_cast<u32>(value) << shift);
            LogDebug("{} IF ACK [0x{:08X}] --> [0x{:08X}]", ProcessorName(processor), old_request, request);
            return;
        }
    }

    Panic("Invalid interrupt register write 0x{:08X}", address);
}
