#pragma once

#include "Mud.hpp"

#include <catch2/catch.hpp>
#include <catch2/trompeloeil.hpp>

namespace test {

struct MockMud : public trompeloeil::mock_interface<Mud> {
    IMPLEMENT_CONST_MOCK0(config);
    IMPLEMENT_MOCK0(world);
    IMPLEMENT_MOCK0(sessions);
    IMPLEMENT_MOCK0(characters);
    IMPLEMENT_MOCK0(database);
    IMPLEMENT_CONST_MOCK0(commands);
    IMPLEMENT_MOCK3(broadcast_to_room);
    IMPLEMENT_MOCK1(broadcast);
    IMPLEMENT_MOCK2(send_to_character);
    IMPLEMENT_MOCK1(leave_world);
    IMPLEMENT_CONST_MOCK0(boot_time);
    IMPLEMENT_CONST_MOCK0(current_time);
};

}
