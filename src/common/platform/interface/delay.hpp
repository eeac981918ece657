#pragma once

/**
 * Abstracts away blocking waits so that the game loops can be driven by a
 * real clock on the device and by a no-op in tests.
 */
class DelayProvider
{
      public:
        virtual ~DelayProvider() = default;
        virtual void delay_ms(int ms) = 0;
};
