#pragma once

#include "input.hpp"
#include <vector>

class DirectionalController
{
      public:
        virtual ~DirectionalController() = default;
        /**
         * Inspects the state of the input source to determine whether the
         * user is currently entering a direction (holding an arrow key,
         * finishing a swipe, ...). The check is instantaneous, callers that
         * want to wait for input need to call it in a loop.
         *
         * If an input is registered, it is written into the `input`
         * parameter and `true` is returned. Otherwise `false` is returned and
         * `input` is left untouched.
         */
        virtual bool poll_for_input(Direction *input) = 0;

        /**
         * One-off initialization of the input source.
         */
        virtual void setup() = 0;
};

class ActionController
{
      public:
        virtual ~ActionController() = default;
        /**
         * Same contract as `DirectionalController::poll_for_input` but for
         * the discrete actions (confirm, back, undo, ...).
         */
        virtual bool poll_for_input(Action *input) = 0;

        virtual void setup() = 0;
};

extern bool
poll_directional_input(std::vector<DirectionalController *> *controllers,
                       Direction *registered_dir);

extern bool poll_action_input(std::vector<ActionController *> *controllers,
                              Action *registered_action);
