#include "cellpaint/command/commands.h"
#include "cellpaint/core/logging.h"
#include "cellpaint/core/util.h"

namespace cellpaint {

StoreError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx) {
    if (!src || byteCount < commandHeaderBytes) {
        CELLPAINT_LOG_WARN("command buffer too short (%u bytes)", byteCount);
        return StoreError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != commandMagicCplc) {
        CELLPAINT_LOG_WARN("command buffer magic mismatch (0x%08x)", magic);
        return StoreError::InvalidMagic;
    }
    const std::uint32_t version = readU32(src, 4);
    if (version != commandVersion) {
        CELLPAINT_LOG_WARN("unsupported command buffer version %u", version);
        return StoreError::UnsupportedVersion;
    }
    const std::uint32_t commandCount = readU32(src, 8);

    std::size_t o = commandHeaderBytes;
    for (std::uint32_t i = 0; i < commandCount; i++) {
        if (o > byteCount || perCommandHeaderBytes > (byteCount - o)) {
            CELLPAINT_LOG_WARN("command %u: header truncated", i);
            return StoreError::BufferTruncated;
        }
        const std::uint32_t op = readU32(src, o); o += 4;
        o += 4; // reserved
        const std::uint32_t payloadByteCount = readU32(src, o); o += 4;
        o += 4; // reserved

        if (payloadByteCount > (byteCount - o)) {
            CELLPAINT_LOG_WARN("command %u: payload truncated", i);
            return StoreError::BufferTruncated;
        }

        const std::uint8_t* payload = src + o;
        if (cb) {
            const StoreError err = cb(ctx, op, payload, payloadByteCount);
            if (err != StoreError::Ok) {
                return err;
            }
        }

        // Payloads are padded to 4 bytes; the last one may end without padding.
        o += alignTo4(payloadByteCount);
        if (o > byteCount) o = byteCount;
    }

    return StoreError::Ok;
}

} // namespace cellpaint
