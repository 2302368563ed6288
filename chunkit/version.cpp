#include <chunkit/version.hpp>

namespace chunkit {
const char* source_id = CHUNKIT_SOURCE_ID;
const char* build_config = CHUNKIT_BUILD_CONFIG;
const char* version = CHUNKIT_VERSION;
const char* full_build_id = CHUNKIT_FULL_BUILD_ID;
}
