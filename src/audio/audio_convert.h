#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Encoding and filtering through an external ffmpeg process.
namespace AudioConvert {

enum class OutputFormat {
    WAV,
    MP3,
    OPUS,
    AAC,
    FLAC,
};

struct FfmpegOptions {
    std::string path = "ffmpeg";
    int timeoutSec = 120;
};

// "wav", "mp3", "opus", "aac", "flac" (case-sensitive).
bool parseOutputFormat(const std::string& name, OutputFormat& out);

// Get file extension for an output format, with leading dot.
const char* formatExtension(OutputFormat format);

// Get ffmpeg codec name for an output format.
const char* formatCodec(OutputFormat format);

const char* contentType(OutputFormat format);

// Run ffmpeg with the given arguments (argv[1..]). stdout/stderr are
// discarded; the process is killed after opts.timeoutSec.
bool runFfmpeg(const FfmpegOptions& opts, const std::vector<std::string>& args, std::string& error);

// Convert a WAV file on disk to the target format.
bool convertFile(const FfmpegOptions& opts, const std::string& inputPath,
                 const std::string& outputPath, OutputFormat format, std::string& error);

// Write a mono track. WAV is written directly, other formats go through a
// temporary WAV and ffmpeg.
bool exportAudio(const std::vector<float>& samples, uint32_t sampleRate,
                 const std::string& path, OutputFormat format,
                 const FfmpegOptions& opts, std::string& error);

// Unique path in the system temp directory, removed when the object dies.
class TempFile {
public:
    explicit TempFile(const std::string& extension);
    ~TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace AudioConvert
