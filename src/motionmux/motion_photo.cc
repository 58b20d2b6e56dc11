#include "motionmux/motion_photo.h"

namespace motionmux {

MotionPhotoFields
make_motion_photo_fields(uint64_t total_bytes, uint64_t photo_bytes,
                         uint64_t presentation_timestamp_us) noexcept
{
    MotionPhotoFields f;
    f.micro_video_offset = total_bytes >= photo_bytes ? total_bytes - photo_bytes
                                                      : 0U;
    f.presentation_timestamp_us = presentation_timestamp_us;
    return f;
}

}  // namespace motionmux
