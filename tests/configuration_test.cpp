#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "src/common/configuration.hpp"
#include "src/common/constants.hpp"
#include "src/common/user_interface.hpp"
#include "src/games/2048.hpp"
#include "src/games/2048_save_state.hpp"
#include "src/games/game_menu.hpp"
#include "src/games/settings.hpp"
#include "temp_storage.hpp"

TEST(ConfigurationOptionTest, SelectsInitialValue)
{
        ConfigurationOption *option =
            ConfigurationOption::of_integers("Target", {512, 1024, 2048}, 2048);
        EXPECT_EQ(option->currently_selected, 2);
        EXPECT_EQ(option->get_curr_int_value(), 2048);
        EXPECT_EQ(option->max_config_value_len, 4);
        delete option;
}

TEST(ConfigurationOptionTest, UnknownInitialValueSelectsFirst)
{
        ConfigurationOption *ints =
            ConfigurationOption::of_integers("Target", {512, 1024}, 3);
        EXPECT_EQ(ints->currently_selected, 0);

        ConfigurationOption *strings =
            ConfigurationOption::of_strings("Sound", {"Yes", "No"}, "Maybe");
        EXPECT_EQ(strings->currently_selected, 0);

        ConfigurationOption *colors =
            ConfigurationOption::of_colors("Color", {Red, Green}, Blue);
        EXPECT_EQ(colors->get_current_color_value(), Red);

        delete ints;
        delete strings;
        delete colors;
}

TEST(ConfigurationOptionTest, FormatsCurrentValue)
{
        ConfigurationOption *option =
            ConfigurationOption::of_integers("Music", {0, 50, 100}, 50);
        char buffer[16];
        EXPECT_STREQ(option->format_current_value(buffer, sizeof(buffer)),
                     "50");
        delete option;
}

TEST(ConfigurationTest, EditingWrapsAround)
{
        Configuration *config = new Configuration(
            "Test",
            {ConfigurationOption::of_integers("A", {1, 2, 3}, 1),
             ConfigurationOption::of_strings("B", {"Yes", "No"}, "No")});
        ConfigurationDiff *diff = empty_diff();

        switch_edited_config_option_up(config, diff);
        EXPECT_EQ(config->curr_selected_option, 1);
        EXPECT_EQ(diff->previously_edited_option, 0);
        EXPECT_EQ(diff->currently_edited_option, 1);

        increment_current_option_value(config, diff);
        EXPECT_STREQ(config->options[1]->get_current_str_value(), "Yes");
        ASSERT_EQ(diff->modified_options.size(), 1u);
        EXPECT_EQ(diff->modified_options[0], 1);

        switch_edited_config_option_down(config, diff);
        EXPECT_EQ(config->curr_selected_option, 0);
        decrement_current_option_value(config, diff);
        EXPECT_EQ(config->options[0]->get_curr_int_value(), 3);

        delete diff;
        free_configuration(config);
}

TEST(ConfigurationTest, YesNoMapping)
{
        EXPECT_TRUE(extract_yes_or_no_option("Yes"));
        EXPECT_FALSE(extract_yes_or_no_option("No"));
        EXPECT_STREQ(map_boolean_to_yes_or_no(true), "Yes");
        EXPECT_STREQ(map_boolean_to_yes_or_no(false), "No");
        EXPECT_EQ(mathematical_modulo(-1, 4), 3);
        EXPECT_EQ(mathematical_modulo(5, 4), 1);
}

TEST(WrapTextTest, BreaksAtSpaces)
{
        std::vector<std::string> lines =
            wrap_text("Tiles with the same value merge", 12);
        EXPECT_EQ(lines, (std::vector<std::string>{"Tiles with", "the same",
                                                   "value merge"}));
}

TEST(WrapTextTest, LongWordGetsItsOwnLine)
{
        std::vector<std::string> lines = wrap_text("a incomprehensibilities b", 8);
        EXPECT_EQ(lines, (std::vector<std::string>{"a", "incomprehensibilities",
                                                   "b"}));
        EXPECT_TRUE(wrap_text("", 8).empty());
}

TEST(UserInterfaceTest, CentersText)
{
        EXPECT_EQ(get_centering_margin(400, 10, 10), 150);
        EXPECT_EQ(rendering_mode_from_str(rendering_mode_to_str(Minimalistic)),
                  Minimalistic);
        EXPECT_EQ(rendering_mode_from_str(rendering_mode_to_str(Detailed)),
                  Detailed);
}

TEST(TileColorTest, SmallTilesUseDarkText)
{
        EXPECT_EQ(tile_text_color(2), DarkText);
        EXPECT_EQ(tile_text_color(4), DarkText);
        EXPECT_EQ(tile_text_color(8), LightText);
        EXPECT_EQ(tile_color(0), EmptyCell);
        EXPECT_EQ(tile_color(2048), Tile2048);
        EXPECT_EQ(tile_color(16384), TileSuper);
}

TEST(StorageLayoutTest, RegionsFollowEachOther)
{
        EXPECT_EQ(get_settings_storage_offset(MainMenu), 0);
        EXPECT_EQ(get_settings_storage_offset(Clean2048),
                  (int)sizeof(GameMenuConfiguration));
        EXPECT_EQ(get_save_state_storage_offset(),
                  get_settings_storage_offset(Clean2048) +
                      (int)sizeof(Game2048Configuration));
        EXPECT_EQ(get_achievements_storage_offset(),
                  get_save_state_storage_offset() +
                      (int)sizeof(Game2048SaveRecord));
}

class Game2048ConfigurationTest : public TempStorageTest
{
};

TEST_F(Game2048ConfigurationTest, MissingConfigurationFallsBackToDefaults)
{
        PersistentStorage storage = make_storage();

        Game2048Configuration config = load_2048_config(&storage);

        EXPECT_EQ(config.target_max_tile, 2048);
        EXPECT_FALSE(config.sound_enabled);
        EXPECT_EQ(config.music_volume, 50);
        EXPECT_EQ(config.effects_volume, 70);

        Game2048Configuration written;
        ASSERT_TRUE(
            storage.get(get_settings_storage_offset(Clean2048), written));
        EXPECT_EQ(written.target_max_tile, 2048);
}

TEST_F(Game2048ConfigurationTest, InvalidConfigurationFallsBackToDefaults)
{
        PersistentStorage storage = make_storage();
        Game2048Configuration invalid = {.target_max_tile = 1000,
                                         .sound_enabled = true,
                                         .music_volume = 50,
                                         .effects_volume = 50};
        ASSERT_TRUE(storage.put(get_settings_storage_offset(Clean2048), invalid));

        Game2048Configuration config = load_2048_config(&storage);
        EXPECT_EQ(config.target_max_tile, 2048);
        EXPECT_FALSE(config.sound_enabled);
}

TEST_F(Game2048ConfigurationTest, CorruptSoundFlagFallsBackToDefaults)
{
        PersistentStorage storage = make_storage();
        Game2048Configuration corrupt = {.target_max_tile = 4096,
                                         .sound_enabled = 7,
                                         .music_volume = 30,
                                         .effects_volume = 40};
        ASSERT_TRUE(storage.put(get_settings_storage_offset(Clean2048), corrupt));

        EXPECT_FALSE(is_valid_2048_config(corrupt));
        Game2048Configuration config = load_2048_config(&storage);
        EXPECT_EQ(config.target_max_tile, 2048);
        EXPECT_EQ(config.sound_enabled, 0);
}

TEST_F(Game2048ConfigurationTest, StoredConfigurationIsUsed)
{
        PersistentStorage storage = make_storage();
        Game2048Configuration stored = {.target_max_tile = 4096,
                                        .sound_enabled = true,
                                        .music_volume = 30,
                                        .effects_volume = 100};
        ASSERT_TRUE(storage.put(get_settings_storage_offset(Clean2048), stored));

        Game2048Configuration config = load_2048_config(&storage);
        EXPECT_EQ(config.target_max_tile, 4096);
        EXPECT_TRUE(config.sound_enabled);
        EXPECT_EQ(config.music_volume, 30);
        EXPECT_EQ(config.effects_volume, 100);
}

TEST(Game2048ConfigurationMenuTest, ExtractsEditedValues)
{
        Configuration *config = assemble_2048_configuration(
            {.target_max_tile = 2048,
             .sound_enabled = false,
             .music_volume = 50,
             .effects_volume = 70});
        ConfigurationDiff *diff = empty_diff();

        // Target 2048 -> 4096, then Sound No -> Yes.
        increment_current_option_value(config, diff);
        switch_edited_config_option_down(config, diff);
        decrement_current_option_value(config, diff);

        Game2048Configuration extracted;
        extract_2048_config(&extracted, config);
        EXPECT_EQ(extracted.target_max_tile, 4096);
        EXPECT_TRUE(extracted.sound_enabled);
        EXPECT_EQ(extracted.music_volume, 50);
        EXPECT_EQ(extracted.effects_volume, 70);
        EXPECT_TRUE(is_valid_2048_config(extracted));

        delete diff;
        free_configuration(config);
}

class MenuConfigurationTest : public TempStorageTest
{
};

TEST_F(MenuConfigurationTest, DefaultsToThe2048Screen)
{
        PersistentStorage storage = make_storage();
        GameMenuConfiguration config = load_initial_menu_configuration(&storage);
        EXPECT_EQ(config.game, Clean2048);
        EXPECT_TRUE(config.show_help_text);
        EXPECT_STREQ(game_to_string(config.game), "2048");
        EXPECT_EQ(game_from_string("Achievements"), AchievementGallery);
        EXPECT_EQ(game_from_string("Tetris"), Unknown);
}

TEST_F(MenuConfigurationTest, CorruptHintFlagFallsBackToDefaults)
{
        PersistentStorage storage = make_storage();
        GameMenuConfiguration corrupt = DEFAULT_MENU_CONFIGURATION;
        corrupt.game = Game::Settings;
        corrupt.show_help_text = 2;
        ASSERT_TRUE(storage.put(get_settings_storage_offset(MainMenu), corrupt));

        GameMenuConfiguration config = load_initial_menu_configuration(&storage);
        EXPECT_EQ(config.game, Clean2048);
        EXPECT_EQ(config.show_help_text, 1);
}
