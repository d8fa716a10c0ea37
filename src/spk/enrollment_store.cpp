#include "spk/enrollment_store.hpp"
#include "spk/errors.hpp"
#include "core/logging.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <cstring>
#include <cstdint>
#include <ctime>

namespace fs = std::filesystem;
using nlohmann::json;

namespace spk {

namespace {

constexpr char kEmbeddingsFile[] = "embeddings.bin";
constexpr char kCentroidFile[] = "centroid.bin";
constexpr char kMetadataFile[] = "metadata.json";
constexpr char kMagic[4] = {'S', 'G', 'E', 'M'};
constexpr uint32_t kVersion = 1;
constexpr uint64_t kHeaderBytes = 16;
constexpr uint32_t kMaxDim = 8192;
constexpr uint32_t kMaxRows = 1024;

void put_u32(std::ostream& out, uint32_t v) {
    unsigned char b[4] = {static_cast<unsigned char>(v & 0xFF),
                          static_cast<unsigned char>((v >> 8) & 0xFF),
                          static_cast<unsigned char>((v >> 16) & 0xFF),
                          static_cast<unsigned char>((v >> 24) & 0xFF)};
    out.write(reinterpret_cast<const char*>(b), 4);
}

bool get_u32(std::istream& in, uint32_t& v) {
    unsigned char b[4];
    if (!in.read(reinterpret_cast<char*>(b), 4)) return false;
    v = static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
        (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
    return true;
}

void write_matrix(const std::string& path, const std::vector<Embedding>& rows) {
    const uint32_t dim = rows.empty() ? 0 : static_cast<uint32_t>(rows[0].size());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw StorageError("Cannot open " + path + " for writing");

    out.write(kMagic, 4);
    put_u32(out, kVersion);
    put_u32(out, static_cast<uint32_t>(rows.size()));
    put_u32(out, dim);
    for (const auto& row : rows) {
        if (row.size() != dim) throw StorageError("Ragged embedding rows for " + path);
        for (float f : row) {
            uint32_t bits;
            std::memcpy(&bits, &f, sizeof(bits));
            put_u32(out, bits);
        }
    }
    out.flush();
    if (!out) throw StorageError("Failed writing " + path);
}

std::vector<Embedding> read_matrix(const std::string& path, uint32_t max_rows) {
    std::error_code ec;
    const uintmax_t file_size = fs::file_size(path, ec);
    if (ec) throw StorageError("Cannot stat " + path + ": " + ec.message());

    std::ifstream in(path, std::ios::binary);
    if (!in) throw StorageError("Cannot open " + path);

    char magic[4];
    uint32_t version = 0, rows = 0, dim = 0;
    if (!in.read(magic, 4) || std::memcmp(magic, kMagic, 4) != 0) {
        throw StorageError("Bad magic in " + path);
    }
    if (!get_u32(in, version) || version != kVersion) {
        throw StorageError("Unsupported version in " + path);
    }
    if (!get_u32(in, rows) || !get_u32(in, dim)) {
        throw StorageError("Truncated header in " + path);
    }
    if (rows > max_rows || dim > kMaxDim) {
        throw StorageError(core::format("Implausible shape %ux%u in %s", rows, dim, path.c_str()));
    }
    // Header is four u32 fields; payload is rows * dim float32
    const uint64_t expected = kHeaderBytes + static_cast<uint64_t>(rows) * dim * sizeof(float);
    if (static_cast<uint64_t>(file_size) != expected) {
        throw StorageError(core::format("Size mismatch in %s: %llu bytes, header implies %llu",
                                        path.c_str(), static_cast<unsigned long long>(file_size),
                                        static_cast<unsigned long long>(expected)));
    }

    std::vector<Embedding> out(rows, Embedding(dim));
    for (auto& row : out) {
        for (float& f : row) {
            uint32_t bits;
            if (!get_u32(in, bits)) throw StorageError("Truncated data in " + path);
            std::memcpy(&f, &bits, sizeof(f));
        }
    }
    return out;
}

void write_metadata(const std::string& path, const EnrollmentMetadata& meta) {
    json j = {{"sample_count", meta.sample_count},
              {"created", meta.created},
              {"threshold", meta.threshold},
              {"embedding_dim", meta.embedding_dim}};
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw StorageError("Cannot open " + path + " for writing");
    out << j.dump(2) << '\n';
    out.flush();
    if (!out) throw StorageError("Failed writing " + path);
}

void remove_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

EnrollmentStore::EnrollmentStore(std::string directory) : m_dir(std::move(directory)) {}

std::string EnrollmentStore::path_of(const char* name) const {
    return (fs::path(m_dir) / name).string();
}

bool EnrollmentStore::has_enrollment() const {
    std::error_code ec;
    return fs::is_regular_file(path_of(kCentroidFile), ec);
}

std::optional<Embedding> EnrollmentStore::load_centroid() const {
    if (!has_enrollment()) return std::nullopt;
    auto rows = read_matrix(path_of(kCentroidFile), 1);
    if (rows.size() != 1 || rows[0].empty()) {
        throw StorageError("Centroid file must hold exactly one non-empty vector");
    }
    return std::move(rows[0]);
}

std::optional<EnrollmentMetadata> EnrollmentStore::load_metadata() const {
    const std::string path = path_of(kMetadataFile);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;

    try {
        std::ifstream in(path);
        json j = json::parse(in);
        EnrollmentMetadata meta;
        meta.sample_count = j.value("sample_count", 0);
        meta.created = j.value("created", std::string());
        meta.threshold = j.value("threshold", 0.0f);
        meta.embedding_dim = j.value("embedding_dim", 0);
        return meta;
    } catch (const json::exception& e) {
        throw StorageError("Corrupt " + path + ": " + e.what());
    }
}

std::optional<EnrollmentRecord> EnrollmentStore::load_record() const {
    auto centroid = load_centroid();
    if (!centroid) return std::nullopt;

    EnrollmentRecord record;
    record.centroid = std::move(*centroid);
    std::error_code ec;
    if (fs::is_regular_file(path_of(kEmbeddingsFile), ec)) {
        record.embeddings = read_matrix(path_of(kEmbeddingsFile), kMaxRows);
    }
    if (auto meta = load_metadata()) {
        record.metadata = *meta;
    }
    return record;
}

void EnrollmentStore::save(const EnrollmentRecord& record) {
    if (record.centroid.empty()) {
        throw StorageError("Refusing to save an empty centroid");
    }

    std::error_code ec;
    fs::create_directories(m_dir, ec);
    if (ec) throw StorageError("Cannot create " + m_dir + ": " + ec.message());

    const std::string emb_path = path_of(kEmbeddingsFile);
    const std::string meta_path = path_of(kMetadataFile);
    const std::string cen_path = path_of(kCentroidFile);
    const std::string emb_tmp = emb_path + ".tmp";
    const std::string meta_tmp = meta_path + ".tmp";
    const std::string cen_tmp = cen_path + ".tmp";

    const std::string finals[] = {emb_path, meta_path, cen_path};
    const std::string tmps[] = {emb_tmp, meta_tmp, cen_tmp};
    auto bak_of = [](const std::string& path) { return path + ".bak"; };

    // Leftovers from an interrupted save
    for (const auto& path : finals) remove_quietly(bak_of(path));

    // The centroid is set aside first and restored last, so a reader never sees a partial record
    bool backed_up[3] = {false, false, false};
    bool placed[3] = {false, false, false};
    const int backup_order[] = {2, 0, 1};
    const int restore_order[] = {1, 0, 2};

    auto rollback = [&]() {
        for (const auto& path : tmps) remove_quietly(path);
        for (int i : restore_order) {
            if (placed[i]) remove_quietly(finals[i]);
            if (!backed_up[i]) continue;
            std::error_code rc;
            fs::rename(bak_of(finals[i]), finals[i], rc);
            if (rc) {
                core::log_error("[EnrollmentStore] Cannot restore " + finals[i] + ": " + rc.message());
            }
        }
    };

    try {
        write_matrix(emb_tmp, record.embeddings);
        write_metadata(meta_tmp, record.metadata);
        write_matrix(cen_tmp, {record.centroid});

        // Set the previous record aside instead of deleting it
        for (int i : backup_order) {
            if (!fs::exists(finals[i], ec)) continue;
            fs::rename(finals[i], bak_of(finals[i]), ec);
            if (ec) throw StorageError("Cannot replace " + finals[i] + ": " + ec.message());
            backed_up[i] = true;
        }

        for (int i = 0; i < 3; ++i) {
            fs::rename(tmps[i], finals[i], ec);
            if (ec) throw StorageError("Cannot rename " + tmps[i] + ": " + ec.message());
            placed[i] = true;
        }
    } catch (const std::exception&) {
        rollback();
        throw;
    }

    for (const auto& path : finals) remove_quietly(bak_of(path));

    core::log_info(core::format("[EnrollmentStore] Saved enrollment (%zu samples, dim %zu) to %s",
                                record.embeddings.size(), record.centroid.size(), m_dir.c_str()));
}

bool EnrollmentStore::clear() {
    const bool existed = has_enrollment();
    // Centroid first: the record stops being visible before the rest goes
    remove_quietly(path_of(kCentroidFile));
    remove_quietly(path_of(kEmbeddingsFile));
    remove_quietly(path_of(kMetadataFile));
    if (existed) {
        core::log_info("[EnrollmentStore] Enrollment removed from " + m_dir);
    }
    return existed;
}

std::string EnrollmentStore::now_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

} // namespace spk
