#pragma once

#include "platform/interface/platform.hpp"
#include "user_interface_customization.hpp"
#include <optional>
#include <vector>

typedef enum ConfigurationOptionType {
        INT,
        STRING,
        COLOR,
} ConfigurationOptionType;

enum class UserAction {
        PlayAgain,
        Exit,
        ShowHelp,
        CloseWindow,
};

typedef struct ConfigurationOption {
        /**
         * The type of the configurable values, it tells which of the value
         * vectors below is populated.
         */
        ConfigurationOptionType type;
        std::vector<int> int_values;
        std::vector<const char *> string_values;
        std::vector<Color> color_values;
        // Currently selected option for this configuration value.
        int currently_selected;
        // Name of the configuration value
        const char *name;
        // Max configuration option string length for UI rendering alignment
        int max_config_value_len;

        ConfigurationOption()
            : type(INT), int_values(), string_values(), color_values(),
              currently_selected(0), name(nullptr), max_config_value_len(0)
        {
        }

      public:
        static ConfigurationOption *of_integers(const char *name,
                                                std::vector<int> values,
                                                int initial_value);
        static ConfigurationOption *of_strings(const char *name,
                                               std::vector<const char *> values,
                                               const char *initial_value);
        static ConfigurationOption *of_colors(const char *name,
                                              std::vector<Color> values,
                                              Color initial_value);

        int available_values_len() const;

        int get_curr_int_value() const
        {
                return int_values[currently_selected];
        }

        const char *get_current_str_value() const
        {
                return string_values[currently_selected];
        }

        Color get_current_color_value() const
        {
                return color_values[currently_selected];
        }

        /**
         * Text representation of the currently selected value, used when
         * rendering the option. Integers are formatted into `buffer`.
         */
        const char *format_current_value(char *buffer, int buffer_len) const;
} ConfigurationOption;

/**
 * A generic container for game configuration values. Every option carries
 * the finite list of values the user can pick from, the currently selected
 * one and the name shown in the UI.
 */
struct Configuration {
        /// Name of the configuration group, rendered as the menu heading.
        const char *name;
        std::vector<ConfigurationOption *> options;
        /**
         * Index of the option that is currently highlighted in the UI and is
         * being edited by the user.
         */
        int curr_selected_option;
        /// Text of the bar at the bottom of the menu that confirms the choice.
        const char *confirmation_cell_text;

        Configuration(const char *name,
                      std::vector<ConfigurationOption *> options,
                      const char *confirmation_cell_text = "Start")
            : name(name), options(options), curr_selected_option(0),
              confirmation_cell_text(confirmation_cell_text)
        {
        }

        int options_len() const { return (int)options.size(); }
};

/**
 * Records what changed after handling a single input so that the menu can
 * be partially re-rendered:
 *   - the edited option switched (the indicator dot needs to be redrawn),
 *   - the value of some options changed and their value cells need to be
 *     redrawn.
 */
struct ConfigurationDiff {
        int previously_edited_option;
        int currently_edited_option;
        std::vector<int> modified_options;
};

ConfigurationDiff *empty_diff();

void switch_edited_config_option_down(Configuration *config,
                                      ConfigurationDiff *diff);
void switch_edited_config_option_up(Configuration *config,
                                    ConfigurationDiff *diff);

void increment_current_option_value(Configuration *config,
                                    ConfigurationDiff *diff);
void decrement_current_option_value(Configuration *config,
                                    ConfigurationDiff *diff);
int find_max_config_option_name_text_length(Configuration *config);
int find_max_config_option_value_text_length(Configuration *config);

/**
 * Lets the user modify the configuration on the platform display until they
 * confirm it. The selected values are stored in the options of `config`.
 *
 * Returns `std::nullopt` if the configuration was confirmed. Otherwise the
 * returned `UserAction` tells the caller why the collection was interrupted:
 * the user went back (`Exit`, only if `allow_exit` is set), asked for the
 * help screen (`ShowHelp`) or closed the window (`CloseWindow`).
 */
std::optional<UserAction>
collect_configuration(Platform *p, Configuration *config,
                      UserInterfaceCustomization *customization,
                      bool allow_exit = true);

void free_configuration(Configuration *config);

/**
 * Maps from 'Yes', 'No' config option values to boolean.
 */
bool extract_yes_or_no_option(const char *value);
/**
 * Maps boolean to 'Yes', 'No' config option values.
 */
const char *map_boolean_to_yes_or_no(bool value);

int mathematical_modulo(int value, int modulus);
