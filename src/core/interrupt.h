#pragma once

#include "util/bitfield.h"
#include "util/types.h"

enum class IRQ : u32 {
    VBLANK = (1 << 0),
    HBLANK = (1 << 1),
    VCOUNTER = (1 << 2),
    TIMER0 = (1 << 3),
    TIMER1 = (1 << 4),
    TIMER2 = (1 << 5),
    TIMER3 = (1 << 6),
    SERIAL = (1 << 7),
    DMA0 = (1 << 8),
    DMA1 = (1 << 9),
    DMA2 = (1 << 10),
    DMA3 = (1 << 11),
    KEYPAD = (1 << 12),
    GAMECARD = (1 << 13),
    IPC_SYNC = (1 << 16),
    IPC_SEND_EMPTY = (1 << 17),
    IPC_RECV_NOT_EMPTY = (1 << 18),
};

// IME/IE/IF register set of one processor
class InterruptController {
public:
    explicit InterruptController(Processor processor);
    void Reset();
    void Request(IRQ irq);

    // true if the master enable is set and an enabled interrupt is requested
    bool Pending() const;

    u8 Read(u32 address) const;
    void Write(u32 address, u8 value);

    static constexpr u32 IME_ADDRESS = 0x04000208;
    static constexpr u32 IE_ADDRESS = 0x04000210;
    static constexpr u32 IF_ADDRESS = 0x04000214;

    static bool InRange(u32 address) {
        return (address >= IME_ADDRESS && address < IME_ADDRESS + 4) ||
               (address >= IE_ADDRESS && address < IF_ADDRESS + 4);
    }

    static const char* GetInterruptName(IRQ irq) {
        switch (irq) {
            case IRQ::VBLANK: return "VBlank";
            case IRQ::HBLANK: return "HBlank";
            case IRQ::VCOUNTER: return "VCounter";
            case IRQ::TIMER0: return "Timer 0";
            case IRQ::TIMER1: return "Timer 1";
            case IRQ::TIMER2: return "Timer 2";
            case IRQ::TIMER3: return "Timer 3";
            case IRQ::SERIAL: return "Serial";
            case IRQ::DMA0: return "DMA 0";
            case IRQ::DMA1: return "DMA 1";
            case IRQ::DMA2: return "DMA 2";
            case IRQ::DMA3: return "DMA 3";
            case IRQ::KEYPAD: return "Keypad";
            case IRQ::GAMECARD: return "Gamecard";
            case IRQ::IPC_SYNC: return "IPC Sync";
            case IRQ::IPC_SEND_EMPTY: return "IPC Send FIFO Empty";
            case IRQ::IPC_RECV_NOT_EMPTY: return "IPC Receive FIFO Not Empty";
            default: return "Invalid IRQ";
        }
    }

    union {
        u32 value = 0;
        BitField<u32, bool, 0, 1> enabled;
    } master_enable;

    u32 enable = 0;
    u32 request = 0;

private:
    static u8 ReadByte(u32 reg, u32 byte) { return static_cast<u8>(reg >> (8 * byte)); }

    const Processor processor;
};
