#include "FFmpegUtils.hpp"

namespace oc {

std::string ffmpegError(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    if (av_strerror(errnum, buf, sizeof(buf)) < 0)
        return "Unknown FFmpeg error " + std::to_string(errnum);
    return std::string(buf);
}

} // namespace oc
