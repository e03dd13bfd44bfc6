#ifndef SCT_IMAGE_SCT_IMAGE_HPP_
#define SCT_IMAGE_SCT_IMAGE_HPP_

#include <sct_image/sct_image_export.h>
#include <sct_image/types.hpp>
#include <sct_image/surface.hpp>
#include <sct_image/container.hpp>
#include <sct_image/decompress.hpp>
#include <sct_image/heuristics.hpp>
#include <sct_image/pixel_formats.hpp>
#include <sct_image/texture_codec.hpp>
#include <sct_image/codec.hpp>
#include <sct_image/codecs/sct.hpp>
#include <sct_image/codecs/png.hpp>
#include <sct_image/batch.hpp>

namespace sct_image {

// All public API is included via the headers above.
// See:
//   - types.hpp:         pixel_format, decode_error, decode_result, decode_options
//   - surface.hpp:       surface interface, memory_surface
//   - container.hpp:     SCT / SCT2 header sniffing and decoding
//   - decompress.hpp:    LZ4 variant used for SCT payloads
//   - heuristics.hpp:    compression probe for SCT2 raw/alpha payloads
//   - pixel_formats.hpp: pixel format code catalog
//   - texture_codec.hpp: ETC2 / ASTC block decoder interface
//   - codec.hpp:         decoder, codec_registry, decode()
//   - codecs/sct.hpp:    SCT decoder (decode_image with diagnostics)
//   - codecs/png.hpp:    PNG output
//   - batch.hpp:         file and directory conversion

} // namespace sct_image

#endif // SCT_IMAGE_SCT_IMAGE_HPP_
