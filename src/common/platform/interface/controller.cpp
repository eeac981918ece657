#include "controller.hpp"

/**
 * Checks the controllers in order and stops at the first one that has
 * registered user input. The direction is written into `registered_dir`.
 */
bool poll_directional_input(std::vector<DirectionalController *> *controllers,
                            Direction *registered_dir)
{
        for (DirectionalController *controller : *controllers) {
                if (controller->poll_for_input(registered_dir)) {
                        return true;
                }
        }
        return false;
}

bool poll_action_input(std::vector<ActionController *> *controllers,
                       Action *registered_action)
{
        for (ActionController *controller : *controllers) {
                if (controller->poll_for_input(registered_action)) {
                        return true;
                }
        }
        return false;
}
