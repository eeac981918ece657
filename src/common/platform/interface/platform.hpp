#pragma once
#include "audio.hpp"
#include "controller.hpp"
#include "delay.hpp"
#include "display.hpp"
#include "persistent_storage.hpp"
#include <vector>

/**
 * Structure encapsulating all interfaces that a given implementation of the
 * platform needs to provide so that the games can run on it. The entrypoint
 * owns every component and keeps them alive for as long as any game runs.
 */
struct Platform {
        Display *display;
        std::vector<DirectionalController *> *directional_controllers;
        std::vector<ActionController *> *action_controllers;
        DelayProvider *delay_provider;
        PersistentStorage *persistent_storage;
        AudioPlayer *audio_player;
};
