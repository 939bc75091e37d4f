#include "audio/audio_convert.h"
#include "audio/audio_io.h"
#include "utils/logger.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <thread>

#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace AudioConvert {

bool parseOutputFormat(const std::string& name, OutputFormat& out) {
    if (name == "wav")  { out = OutputFormat::WAV;  return true; }
    if (name == "mp3")  { out = OutputFormat::MP3;  return true; }
    if (name == "opus") { out = OutputFormat::OPUS; return true; }
    if (name == "aac")  { out = OutputFormat::AAC;  return true; }
    if (name == "flac") { out = OutputFormat::FLAC; return true; }
    return false;
}

const char* formatExtension(OutputFormat format) {
    switch (format) {
        case OutputFormat::WAV:  return ".wav";
        case OutputFormat::MP3:  return ".mp3";
        case OutputFormat::OPUS: return ".opus";
        case OutputFormat::AAC:  return ".aac";
        case OutputFormat::FLAC: return ".flac";
    }
    return ".bin";
}

const char* formatCodec(OutputFormat format) {
    switch (format) {
        case OutputFormat::WAV:  return "pcm_s16le";
        case OutputFormat::MP3:  return "libmp3lame";
        case OutputFormat::OPUS: return "libopus";
        case OutputFormat::AAC:  return "aac";
        case OutputFormat::FLAC: return "flac";
    }
    return "";
}

const char* contentType(OutputFormat format) {
    switch (format) {
        case OutputFormat::WAV:  return "audio/wav";
        case OutputFormat::MP3:  return "audio/mpeg";
        case OutputFormat::OPUS: return "audio/opus";
        case OutputFormat::AAC:  return "audio/aac";
        case OutputFormat::FLAC: return "audio/flac";
    }
    return "application/octet-stream";
}

// ── Temp files ──

TempFile::TempFile(const std::string& extension) {
    static std::atomic<uint64_t> counter{0};
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::filesystem::path dir = std::filesystem::temp_directory_path();
    path_ = (dir / ("dubline_" + std::to_string((long long)getpid()) + "_" +
                    std::to_string(counter.fetch_add(1)) + "_" +
                    std::to_string((long long)(now % 1000000)) + extension)).string();
}

TempFile::~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

// ── Subprocess ──

bool runFfmpeg(const FfmpegOptions& opts, const std::vector<std::string>& args, std::string& error) {
    std::vector<std::string> full;
    full.push_back(opts.path);
    full.push_back("-hide_banner");
    full.push_back("-loglevel");
    full.push_back("error");
    full.insert(full.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& a : full) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, opts.path.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        error = "cannot launch " + opts.path + ": " + strerror(rc);
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(opts.timeoutSec);
    int status = 0;
    for (;;) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            error = std::string("waitpid failed: ") + strerror(errno);
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            error = "ffmpeg timed out after " + std::to_string(opts.timeoutSec) + " s";
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        error = "ffmpeg exited with status " +
                std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
        return false;
    }
    return true;
}

bool convertFile(const FfmpegOptions& opts, const std::string& inputPath,
                 const std::string& outputPath, OutputFormat format, std::string& error) {
    return runFfmpeg(opts, {"-y", "-i", inputPath, "-c:a", formatCodec(format), outputPath}, error);
}

bool exportAudio(const std::vector<float>& samples, uint32_t sampleRate,
                 const std::string& path, OutputFormat format,
                 const FfmpegOptions& opts, std::string& error) {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    if (format == OutputFormat::WAV) {
        if (!AudioIO::writeWav(path, samples, sampleRate)) {
            error = "cannot write " + path;
            return false;
        }
        return true;
    }

    TempFile tmp(".wav");
    if (!AudioIO::writeWav(tmp.path(), samples, sampleRate)) {
        error = "cannot write temporary WAV";
        return false;
    }
    if (!convertFile(opts, tmp.path(), path, format, error)) {
        LOG_ERROR("Export", "%s conversion failed: %s", formatExtension(format), error.c_str());
        return false;
    }
    return true;
}

} // namespace AudioConvert
