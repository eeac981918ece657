#include <gtest/gtest.h>

#include "src/common/platform/interface/controller.hpp"
#include "src/common/platform/interface/input.hpp"

TEST(SwipeDirectionTest, DominantAxisWins)
{
        EXPECT_EQ(direction_from_swipe(800.0f, 100.0f), RIGHT);
        EXPECT_EQ(direction_from_swipe(-800.0f, 300.0f), LEFT);
        EXPECT_EQ(direction_from_swipe(100.0f, 900.0f), DOWN);
        EXPECT_EQ(direction_from_swipe(-200.0f, -900.0f), UP);
}

TEST(SwipeDirectionTest, SlowDragsAreIgnored)
{
        EXPECT_FALSE(direction_from_swipe(0.0f, 0.0f).has_value());
        EXPECT_FALSE(direction_from_swipe(200.0f, 10.0f).has_value());
        EXPECT_FALSE(direction_from_swipe(-10.0f, -249.0f).has_value());
}

TEST(SwipeDirectionTest, ThresholdIsInclusive)
{
        EXPECT_EQ(direction_from_swipe(SWIPE_VELOCITY_THRESHOLD, 0.0f), RIGHT);
        EXPECT_EQ(direction_from_swipe(0.0f, -SWIPE_VELOCITY_THRESHOLD), UP);
}

TEST(SwipeDirectionTest, CustomThreshold)
{
        EXPECT_FALSE(direction_from_swipe(500.0f, 0.0f, 600.0f).has_value());
        EXPECT_EQ(direction_from_swipe(700.0f, 0.0f, 600.0f), RIGHT);
}

TEST(SwipeDirectionTest, DiagonalPrefersHorizontal)
{
        EXPECT_EQ(direction_from_swipe(500.0f, 500.0f), RIGHT);
        EXPECT_EQ(direction_from_swipe(-500.0f, -500.0f), LEFT);
}

TEST(DirectionTest, Names)
{
        EXPECT_STREQ(direction_to_str(LEFT), "Left");
        EXPECT_STREQ(action_to_str(UNDO), "Undo");
}

namespace
{

class ScriptedController : public DirectionalController
{
      public:
        explicit ScriptedController(std::optional<Direction> next)
            : next(next), polls(0)
        {
        }

        bool poll_for_input(Direction *input) override
        {
                polls++;
                if (!next) {
                        return false;
                }
                *input = *next;
                return true;
        }
        void setup() override {}

        std::optional<Direction> next;
        int polls;
};

} // namespace

TEST(ControllerPollingTest, FirstControllerWithInputWins)
{
        ScriptedController idle(std::nullopt);
        ScriptedController left(LEFT);
        ScriptedController up(UP);
        std::vector<DirectionalController *> controllers = {&idle, &left, &up};

        Direction direction = DOWN;
        EXPECT_TRUE(poll_directional_input(&controllers, &direction));
        EXPECT_EQ(direction, LEFT);
        EXPECT_EQ(up.polls, 0);

        std::vector<DirectionalController *> only_idle = {&idle};
        direction = DOWN;
        EXPECT_FALSE(poll_directional_input(&only_idle, &direction));
        EXPECT_EQ(direction, DOWN);
}
