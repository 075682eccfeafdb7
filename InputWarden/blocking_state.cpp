#include "blocking_state.h"

template class BlockingStateMachine<KeyboardAdvancedConfig>;
template class BlockingStateMachine<MouseAdvancedConfig>;

const char* BlockingModeKindToString(BlockingModeKind kind)
{
    switch (kind)
    {
    case BlockingModeKind::Simple:   return "Simple";
    case BlockingModeKind::Advanced: return "Advanced";
    case BlockingModeKind::Select:   return "Select";
    }
    return "Unknown";
}
