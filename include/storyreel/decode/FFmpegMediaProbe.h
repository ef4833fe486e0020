// Repository: StoryReel
// Component: FFmpeg Media Probe
// Purpose: Container-level inspection (duration, stream presence) using libavformat.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_DECODE_FFMPEG_MEDIA_PROBE_H_
#define STORYREEL_DECODE_FFMPEG_MEDIA_PROBE_H_

#include <optional>
#include <string>

namespace storyreel::decode {

struct MediaProbeInfo {
  double duration_s = 0.0;
  bool has_video = false;
  bool has_audio = false;
  int width = 0;   // 0 when there is no video stream
  int height = 0;
};

// FFmpegMediaProbe opens a container, reads stream info and closes it again.
// No frames are decoded. Safe to call from any thread.
class FFmpegMediaProbe {
 public:
  // Returns empty optional when the input cannot be opened or reports no
  // usable duration.
  static std::optional<MediaProbeInfo> Probe(const std::string& uri);
};

}  // namespace storyreel::decode

#endif  // STORYREEL_DECODE_FFMPEG_MEDIA_PROBE_H_
