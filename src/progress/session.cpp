#include "fpb/progress/session.hpp"

namespace fpb {
namespace progress {

const char* unitToString(ProgressUnit unit) {
    switch (unit) {
        case ProgressUnit::SECONDS: return "seconds";
        case ProgressUnit::FRAMES: return "frames";
    }
    return "seconds";
}

}}
