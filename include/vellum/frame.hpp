#pragma once

#include <cstdint>

namespace vellum
{

struct Frame
{
    float    elapsed_sec = 0.0f;   // since the engine was last started
    float    dt          = 0.0f;   // since the previous tick
    uint64_t number      = 0;      // ticks executed since construction

    float    elapsed_seconds() const { return elapsed_sec; }
    float    delta_time() const { return dt; }
    uint64_t frame_number() const { return number; }
};

}   // namespace vellum
