#include <algorithm>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>

#include "configuration.hpp"
#include "constants.hpp"
#include "logging.hpp"
#include "user_interface.hpp"
#include "platform/interface/controller.hpp"
#include "platform/interface/color.hpp"

#define TAG "configuration"

/**
 * Maps a stored value onto its index in the list of available values. The
 * persistent storage only keeps the values, not their indices. Unknown
 * values (e.g. a corrupted storage) select the first option.
 */
template <typename T>
static int find_initial_index(const char *name, const std::vector<T> &values,
                              T initial_value)
{
        auto it = std::find(values.begin(), values.end(), initial_value);
        if (it == values.end()) {
                LOG_WARN(TAG,
                         "Initial value of option '%s' is not available, "
                         "falling back to the first value.",
                         name);
                return 0;
        }
        return it - values.begin();
}

ConfigurationOption *ConfigurationOption::of_integers(const char *name,
                                                      std::vector<int> values,
                                                      int initial_value)
{
        ConfigurationOption *option = new ConfigurationOption();
        option->name = name;
        option->type = INT;
        option->int_values = values;
        option->currently_selected =
            find_initial_index(name, values, initial_value);
        for (int value : values) {
                option->max_config_value_len =
                    std::max(option->max_config_value_len,
                             (int)std::to_string(value).size());
        }
        return option;
}

ConfigurationOption *
ConfigurationOption::of_strings(const char *name,
                                std::vector<const char *> values,
                                const char *initial_value)
{
        ConfigurationOption *option = new ConfigurationOption();
        option->name = name;
        option->type = STRING;
        option->string_values = values;
        option->currently_selected = 0;
        bool found = false;
        for (size_t i = 0; i < values.size(); i++) {
                option->max_config_value_len = std::max(
                    option->max_config_value_len, (int)strlen(values[i]));
                if (!found && initial_value &&
                    strcmp(values[i], initial_value) == 0) {
                        option->currently_selected = i;
                        found = true;
                }
        }
        if (!found) {
                LOG_WARN(TAG,
                         "Initial value of option '%s' is not available, "
                         "falling back to the first value.",
                         name);
        }
        return option;
}

ConfigurationOption *ConfigurationOption::of_colors(const char *name,
                                                    std::vector<Color> values,
                                                    Color initial_value)
{
        ConfigurationOption *option = new ConfigurationOption();
        option->name = name;
        option->type = COLOR;
        option->color_values = values;
        option->currently_selected =
            find_initial_index(name, values, initial_value);
        for (Color value : values) {
                option->max_config_value_len =
                    std::max(option->max_config_value_len,
                             (int)strlen(color_to_string(value)));
        }
        return option;
}

int ConfigurationOption::available_values_len() const
{
        switch (type) {
        case INT:
                return int_values.size();
        case STRING:
                return string_values.size();
        case COLOR:
                return color_values.size();
        }
        return 0;
}

const char *ConfigurationOption::format_current_value(char *buffer,
                                                      int buffer_len) const
{
        switch (type) {
        case INT:
                snprintf(buffer, buffer_len, "%d", get_curr_int_value());
                return buffer;
        case STRING:
                return get_current_str_value();
        case COLOR:
                return color_to_string(get_current_color_value());
        }
        return "";
}

int mathematical_modulo(int value, int modulus)
{
        return ((value % modulus) + modulus) % modulus;
}

ConfigurationDiff *empty_diff()
{
        ConfigurationDiff *diff = new ConfigurationDiff();
        diff->previously_edited_option = 0;
        diff->currently_edited_option = 0;
        return diff;
}

static void shift_edited_config_option(Configuration *config,
                                       ConfigurationDiff *diff, int steps);

/**
 * Moves the highlight to the option above the current one, wrapping around
 * to the bottom of the menu. */
void switch_edited_config_option_up(Configuration *config,
                                    ConfigurationDiff *diff)
{
        shift_edited_config_option(config, diff, -1);
}

/**
 * Moves the highlight to the option below the current one, wrapping around
 * to the top of the menu. */
void switch_edited_config_option_down(Configuration *config,
                                      ConfigurationDiff *diff)
{
        shift_edited_config_option(config, diff, 1);
}

static void shift_edited_config_option(Configuration *config,
                                       ConfigurationDiff *diff, int steps)
{
        diff->previously_edited_option = config->curr_selected_option;
        config->curr_selected_option = mathematical_modulo(
            config->curr_selected_option + steps, config->options_len());
        diff->currently_edited_option = config->curr_selected_option;
        LOG_DEBUG(TAG, "Edited option switched from %d to %d",
                  diff->previously_edited_option,
                  diff->currently_edited_option);
}

static void shift_current_config_option_value(Configuration *config,
                                              ConfigurationDiff *diff,
                                              int steps);

void increment_current_option_value(Configuration *config,
                                    ConfigurationDiff *diff)
{
        shift_current_config_option_value(config, diff, 1);
}

void decrement_current_option_value(Configuration *config,
                                    ConfigurationDiff *diff)
{
        shift_current_config_option_value(config, diff, -1);
}

static void shift_current_config_option_value(Configuration *config,
                                              ConfigurationDiff *diff,
                                              int steps)
{
        int curr_idx = config->curr_selected_option;
        ConfigurationOption *current = config->options[curr_idx];

        current->currently_selected =
            mathematical_modulo(current->currently_selected + steps,
                                current->available_values_len());

        diff->previously_edited_option = curr_idx;
        diff->currently_edited_option = curr_idx;
        diff->modified_options.push_back(curr_idx);
}

int find_max_config_option_value_text_length(Configuration *config)
{
        int max_length = 0;
        for (ConfigurationOption *option : config->options) {
                max_length = std::max(max_length, option->max_config_value_len);
        }
        return max_length;
}

int find_max_config_option_name_text_length(Configuration *config)
{
        int max_length = 0;
        for (ConfigurationOption *option : config->options) {
                max_length = std::max(max_length, (int)strlen(option->name));
        }
        return max_length;
}

void free_configuration(Configuration *config)
{
        for (ConfigurationOption *option : config->options) {
                delete option;
        }
        delete config;
}

std::optional<UserAction>
collect_configuration(Platform *p, Configuration *config,
                      UserInterfaceCustomization *customization,
                      bool allow_exit)
{
        ConfigurationDiff *initial_diff = empty_diff();
        initial_diff->currently_edited_option = config->curr_selected_option;
        initial_diff->previously_edited_option = config->curr_selected_option;
        render_config_menu(p->display, config, initial_diff, false,
                           customization);
        if (customization->show_help_text) {
                render_controls_explanations(p->display);
        }
        delete initial_diff;

        auto move_registered_delay = [&] {
                p->delay_provider->delay_ms(MOVE_REGISTERED_DELAY);
        };

        while (true) {
                Action act;
                Direction dir;
                // We get a fresh, empty diff during each iteration to avoid
                // option value text rerendering when they are not modified.
                ConfigurationDiff *diff = empty_diff();
                diff->previously_edited_option = config->curr_selected_option;
                diff->currently_edited_option = config->curr_selected_option;

                if (poll_action_input(p->action_controllers, &act)) {
                        move_registered_delay();
                        delete diff;
                        switch (act) {
                        case CONFIRM:
                                return std::nullopt;
                        case BACK:
                                if (allow_exit) {
                                        return UserAction::Exit;
                                }
                                break;
                        case HELP:
                                return UserAction::ShowHelp;
                        default:
                                break;
                        }
                        continue;
                }

                if (poll_directional_input(p->directional_controllers, &dir)) {
                        switch (dir) {
                        case DOWN:
                                switch_edited_config_option_down(config, diff);
                                break;
                        case UP:
                                switch_edited_config_option_up(config, diff);
                                break;
                        case LEFT:
                                decrement_current_option_value(config, diff);
                                break;
                        case RIGHT:
                                increment_current_option_value(config, diff);
                                break;
                        }

                        render_config_menu(p->display, config, diff, true,
                                           customization);
                        move_registered_delay();
                }
                delete diff;

                p->delay_provider->delay_ms(INPUT_POLLING_DELAY);
                if (!p->display->refresh()) {
                        return UserAction::CloseWindow;
                }
        }
}

bool extract_yes_or_no_option(const char *value)
{
        return strcmp(value, "Yes") == 0;
}

const char *map_boolean_to_yes_or_no(bool value)
{
        return value ? "Yes" : "No";
}
