#include "ingest/transport/upload_manifest.hpp"

#include "ingest/pipeline/marker.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unordered_map>

namespace ingest::transport {
namespace fs = std::filesystem;

std::uint64_t UploadManifest::total_bytes() const {
    std::uint64_t total = 0;
    for (const auto& entry : files) {
        total += entry.size;
    }
    return total;
}

std::string UploadManifest::qualified_name(const ManifestEntry& entry) const {
    return directory.filename().generic_string() + "/" + entry.name;
}

Result<UploadManifest> build_manifest(const fs::path& directory) {
    UploadManifest manifest;
    manifest.directory = directory;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return Err<UploadManifest>(ErrorCode::IoError, "Not a directory: " + directory.string());
    }

    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end{};
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        const fs::path& path = it->path();
        if (pipeline::is_marker_file(path.filename().string())) {
            continue;
        }

        ManifestEntry entry;
        entry.absolute_path = path;
        entry.name = path.lexically_relative(directory).generic_string();
        entry.size = it->file_size(entry_ec);
        if (entry_ec) {
            return Err<UploadManifest>(ErrorCode::IoError,
                                       "Cannot stat " + path.string() + ": " + entry_ec.message());
        }
        entry.mime_type = mime_type_for(path);
        manifest.files.push_back(std::move(entry));
    }
    if (ec) {
        return Err<UploadManifest>(ErrorCode::IoError, "Cannot list " + directory.string() + ": " + ec.message());
    }
    if (manifest.files.empty()) {
        return Err<UploadManifest>(ErrorCode::TransferFailed, "No files found in " + directory.string());
    }

    std::sort(manifest.files.begin(), manifest.files.end(),
              [](const ManifestEntry& a, const ManifestEntry& b) { return a.name < b.name; });
    return Ok(std::move(manifest));
}

std::string mime_type_for(const fs::path& file) {
    static const std::unordered_map<std::string, std::string> types {
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"},
        {".gif", "image/gif"}, {".heic", "image/heic"}, {".webp", "image/webp"},
        {".tif", "image/tiff"}, {".tiff", "image/tiff"}, {".dng", "image/x-adobe-dng"},
        {".mp4", "video/mp4"}, {".m4v", "video/x-m4v"}, {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"}, {".mkv", "video/x-matroska"}, {".mts", "video/mp2t"},
        {".txt", "text/plain"}, {".json", "application/json"}, {".pdf", "application/pdf"},
        {".zip", "application/zip"},
    };

    std::string extension = file.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto it = types.find(extension);
    return it == types.end() ? "application/octet-stream" : it->second;
}

std::string slugify(const std::string& name) {
    std::string slug;
    slug.reserve(name.size());
    bool in_run = false;
    for (unsigned char c : name) {
        const char lower = static_cast<char>(std::tolower(c));
        const bool keep = c < 0x80 && (std::isalnum(c) || c == '.' || c == '_' || c == '-');
        if (keep) {
            slug += lower;
            in_run = false;
        } else if (!in_run) {
            slug += '-';
            in_run = true;
        }
    }

    const auto first = slug.find_first_not_of('-');
    if (first == std::string::npos) {
        return "upload";
    }
    const auto last = slug.find_last_not_of('-');
    return slug.substr(first, last - first + 1);
}

Result<void> for_each_chunk(const fs::path& file,
                            std::size_t chunk_size,
                            const std::function<Result<void>(FileChunk&&)>& sink) {
    if (chunk_size == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "chunk_size must be > 0");
    }

    std::ifstream input(file, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorCode::IoError, "Failed to open source file: " + file.string());
    }

    std::error_code ec;
    const auto file_size = fs::file_size(file, ec);
    if (ec) {
        return Err<void>(ErrorCode::IoError, "Cannot stat " + file.string() + ": " + ec.message());
    }
    const auto total_chunks = static_cast<std::uint32_t>((file_size + chunk_size - 1) / chunk_size);

    std::uint64_t offset = 0;
    for (std::uint32_t index = 0; index < total_chunks; ++index) {
        FileChunk chunk;
        chunk.index = index;
        chunk.total = total_chunks;
        chunk.offset = offset;
        chunk.data.resize(static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, file_size - offset)));

        input.read(reinterpret_cast<char*>(chunk.data.data()), static_cast<std::streamsize>(chunk.data.size()));
        if (static_cast<std::size_t>(input.gcount()) != chunk.data.size()) {
            return Err<void>(ErrorCode::IoError, "Short read from " + file.string() + " (file changed during upload?)");
        }
        offset += chunk.data.size();

        auto result = sink(std::move(chunk));
        if (result.is_error()) {
            return result;
        }
    }
    return Ok();
}

Result<std::vector<std::uint8_t>> read_file(const fs::path& file) {
    std::ifstream input(file, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::IoError, "Failed to open " + file.string());
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::IoError, "Failed to read " + file.string());
    }
    return Ok(std::move(data));
}

} // namespace ingest::transport
