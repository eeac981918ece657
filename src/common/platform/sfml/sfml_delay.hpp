#pragma once
#include "../interface/delay.hpp"
#include <chrono>
#include <thread>

class SfmlDelay : public DelayProvider
{
      public:
        void delay_ms(int ms) override
        {
                std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
};
