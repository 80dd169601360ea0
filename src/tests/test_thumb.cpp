#include <catch2/catch.hpp>

#include "test_environment.h"

using namespace CPU;
using Tests::AccessRecord;
using Tests::TestEnvironment;

TEST_CASE("THUMB[PipelinePCOffset]", "[thumb]") {
    TestEnvironment env;
    env.LoadThumb(0x1000, {0x4678});    // mov r0, pc

    REQUIRE(env.cpu.InThumbMode());
    REQUIRE(env.cpu.GetNextInstructionAddress() == 0x1000);

    env.Step();

    REQUIRE(env.cpu.regs.r[0] == 0x1004);
    REQUIRE(env.Elapsed() == 1);
    REQUIRE(env.bus.GetAccesses()[0] == AccessRecord {AccessType::S, 0x1004, 2, false});
}

TEST_CASE("THUMB[ImmediateAndAddSubtract]", "[thumb]") {
    TestEnvironment env;
    env.LoadThumb(0x1000, {
        0x2005,    // mov r0, #5
        0x1CC1,    // add r1, r0, #3
        0x2805,    // cmp r0, #5
    });
    auto& regs = env.cpu.regs;

    env.Step(3);

    REQUIRE(regs.r[0] == 5);
    REQUIRE(regs.r[1] == 8);
    REQUIRE(regs.cpsr.Z);
    REQUIRE(regs.cpsr.C);
    REQUIRE_FALSE(regs.cpsr.N);
}

TEST_CASE("THUMB[ALU]", "[thumb]") {
    TestEnvironment env;
    auto& regs = env.cpu.regs;

    SECTION("neg") {
        env.LoadThumb(0x1000, {0x4248});    // neg r0, r1
        regs.r[1] = 1;
        env.Step();

        REQUIRE(regs.r[0] == 0xFFFFFFFF);
        REQUIRE(regs.cpsr.N);
        REQUIRE_FALSE(regs.cpsr.C);
    }

    SECTION("mul") {
        env.LoadThumb(0x1000, {0x4348});    // mul r0, r1
        regs.r[0] = 6;
        regs.r[1] = 7;
        env.Step();

        REQUIRE(regs.r[0] == 42);
    }

    SECTION("register shift") {
        env.LoadThumb(0x1000, {0x4088});    // lsl r0, r1
        regs.r[0] = 1;
        regs.r[1] = 4;
        env.Step();

        REQUIRE(regs.r[0] == 16);
        REQUIRE(env.Elapsed() == 2);
    }
}

TEST_CASE("THUMB[LoadStore]", "[thumb]") {
    TestEnvironment env;
    env.LoadThumb(0x1000, {
        0x6048,    // str r0, [r1, #4]
        0x794A,    // ldrb r2, [r1, #5]
        0x5F0B,    // ldsh r3, [r1, r4]
    });
    auto& regs = env.cpu.regs;
    regs.r[0] = 0x00008001;
    regs.r[1] = 0x2000;
    regs.r[4] = 4;

    env.Step(3);

    REQUIRE(env.bus.GetMemory32(0x2004) == 0x00008001);
    REQUIRE(regs.r[2] == 0x80);
    REQUIRE(regs.r[3] == 0xFFFF8001);
}

TEST_CASE("THUMB[StackPointer]", "[thumb]") {
    TestEnvironment env;
    env.LoadThumb(0x1000, {
        0xB082,    // sub sp, #8
        0x9001,    // str r0, [sp, #4]
    });
    auto& regs = env.cpu.regs;
    regs.r[SP] = 0x3100;
    regs.r[0] = 0x1234;

    env.Step(2);

    REQUIRE(regs.r[SP] == 0x30F8);
    REQUIRE(env.bus.GetMemory32(0x30FC) == 0x1234);
}

TEST_CASE("THUMB[PushPop]", "[thumb]") {
    TestEnvironment env;
    auto& regs = env.cpu.regs;

    SECTION("registers") {
        env.LoadThumb(0x1000, {
            0xB503,    // push {r0, r1, lr}
            0xBC0C,    // pop {r2, r3}
        });
        regs.r[0] = 0xAAAA;
        regs.r[1] = 0xBBBB;
        regs.r[LR] = 0xCCCC;
        regs.r[SP] = 0x3100;

        env.Step();

        REQUIRE(env.bus.GetMemory32(0x30F4) == 0xAAAA);
        REQUIRE(env.bus.GetMemory32(0x30F8) == 0xBBBB);
        REQUIRE(env.bus.GetMemory32(0x30FC) == 0xCCCC);
        REQUIRE(regs.r[SP] == 0x30F4);

        env.Step();

        REQUIRE(regs.r[2] == 0xAAAA);
        REQUIRE(regs.r[3] == 0xBBBB);
        REQUIRE(regs.r[SP] == 0x30FC);
    }

    SECTION("pop pc stays in THUMB state") {
        env.LoadThumb(0x1000, {0xBD00});    // pop {pc}
        env.bus.SetMemory32(0x3000, 0x2001);
        regs.r[SP] = 0x3000;

        env.Step();

        REQUIRE(env.cpu.InThumbMode());
        REQUIRE(env.cpu.GetNextInstructionAddress() == 0x2000);
        REQUIRE(regs.r[SP] == 0x3004);
    }
}

TEST_CASE("THUMB[PCRelativeLoad]", "[thumb]") {
    TestEnvironment env;
    env.LoadThumb(0x1000, {
        0x4801,    // ldr r0, [pc, #4]
        0x4901,    // ldr r1, [pc, #4]
    });
    env.bus.SetMemory32(0x1008, 0xCAFEBABE);

    env.Step(2);

    // PC is word aligned for the address calculation
    REQUIRE(env.cpu.regs.r[0] == 0xCAFEBABE);
    REQUIRE(env.cpu.regs.r[1] == 0xCAFEBABE);
}

TEST_CASE("THUMB[Branches]", "[thumb]") {
    TestEnvironment env;
    auto& regs = env.cpu.regs;

    SECTION("long branch with link") {
        env.LoadThumb(0x1000, {0xF000, 0xF802});    // bl 0x1008
        env.Step(2);

        REQUIRE(regs.r[LR] == 0x1005);
        REQUIRE(env.cpu.GetNextInstructionAddress() == 0x1008);
    }

    SECTION("conditional branch taken") {
        env.LoadThumb(0x1000, {
            0x4280,    // cmp r0, r0
            0xD002,    // beq 0x100A
        });
        env.Step(2);

        REQUIRE(env.cpu.GetNextInstructionAddress() == 0x100A);
    }

    SECTION("conditional branch not taken") {
        env.LoadThumb(0x1000, {
            0x4280,    // cmp r0, r0
            0xD102,    // bne 0x100A
        });
        env.Step(2);

        REQUIRE(env.cpu.GetNextInstructionAddress() == 0x1004);
    }

    SECTION("unconditional branch") {
        env.LoadThumb(0x1000, {0xE7FE});    // b 0x1000
        env.Step();

        REQUIRE(env.cpu.GetNextInstructionAddress() == 0x1000);
    }

    SECTION("branch and exchange to ARM") {
        env.LoadThumb(0x1000, {0x4700});    // bx r0
        regs.r[0] = 0x2000;
        env.Step();

        REQUIRE_FALSE(env.cpu.InThumbMode());
        REQUIRE(env.cpu.GetNextInstructionAddress() == 0x2000);
    }
}

TEST_CASE("THUMB[SoftwareInterrupt]", "[thumb]") {
    TestEnvironment env;
    env.LoadThumb(0x1000, {0xDF05});    // swi #5
    auto& regs = env.cpu.regs;

    env.Step();

    REQUIRE_FALSE(env.cpu.InThumbMode());
    REQUIRE(regs.GetMode() == Mode::SVC);
    REQUIRE(regs.r[LR] == 0x1002);
    REQUIRE((regs.GetSPSR() & 0x20) != 0);
    REQUIRE(env.cpu.GetNextInstructionAddress() == VECTOR_SWI);
}
