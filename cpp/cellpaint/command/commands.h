#ifndef CELLPAINT_COMMAND_COMMANDS_H
#define CELLPAINT_COMMAND_COMMANDS_H

#include "cellpaint/core/types.h"
#include <cstdint>
#include <cstddef>

namespace cellpaint {

using CommandCallback = StoreError(*)(void* ctx, std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount);

// Parse a command buffer and invoke the callback for each command.
// Returns StoreError::Ok on success, or the first error (from the buffer
// layout or from the callback). Commands before the failing one have
// already been delivered.
StoreError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx);

}

#endif // CELLPAINT_COMMAND_COMMANDS_H
