#include "core/protocol/CommandId.hpp"

namespace camlink::core {

bool isSupportedCommand(uint32_t commandId) {
    if (commandId >= EXTENSION_COMMAND_BASE) {
        return true;
    }
    switch (static_cast<CommandId>(commandId)) {
    case CommandId::Login:
    case CommandId::KeepAlive:
    case CommandId::SystemInfo:
    case CommandId::PtzControl:
    case CommandId::StartPlayback:
    case CommandId::ListRecordings:
        return true;
    }
    return false;
}

std::string commandIdToString(uint32_t commandId) {
    if (commandId >= EXTENSION_COMMAND_BASE) {
        return "Extension(" + std::to_string(commandId) + ")";
    }
    switch (static_cast<CommandId>(commandId)) {
    case CommandId::Login:
        return "Login";
    case CommandId::KeepAlive:
        return "KeepAlive";
    case CommandId::SystemInfo:
        return "SystemInfo";
    case CommandId::PtzControl:
        return "PtzControl";
    case CommandId::StartPlayback:
        return "StartPlayback";
    case CommandId::ListRecordings:
        return "ListRecordings";
    }
    return "Unknown(" + std::to_string(commandId) + ")";
}

} // namespace camlink::core
