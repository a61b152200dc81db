#include "ErrorSink.hpp"

#include "csv/CsvWriter.hpp"
#include "log/TaggedLogger.hpp"

#include <array>
#include <system_error>

namespace CT::IO {

ErrorSink::ErrorSink(std::filesystem::path path, std::string stageName, std::ofstream stream)
    : filePath(std::move(path)), stageName(std::move(stageName)), stream(std::move(stream)) {}

auto ErrorSink::open(std::filesystem::path const& path, std::string stageName) -> Expected<ErrorSink> {
    std::error_code ec;
    if (auto parent = path.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::IoFailure,
                                         "cannot create directory " + parent.string() + ": " + ec.message()});
        }
    }
    if (std::filesystem::exists(path, ec)) {
        ct_log("Removing previous error file " + path.string(), "INFO", "ErrorSink");
        std::filesystem::remove(path, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::IoFailure,
                                         "cannot remove previous error file " + path.string() + ": " + ec.message()});
        }
    }

    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot open error file " + path.string()});
    }
    return ErrorSink{path, std::move(stageName), std::move(stream)};
}

auto ErrorSink::record(std::string_view subject, RecordKind kind, std::string_view detail) -> Expected<void> {
    auto const kindName = recordKindToString(kind);
    ct_log("[" + stageName + "] " + std::string{kindName} + " for '" + std::string{subject} + "': " + std::string{detail},
           "WARNING",
           "ErrorSink");

    std::array<std::string_view, 3> const fields{subject, kindName, detail};
    stream << Csv::formatRow(fields);
    stream.flush();
    if (!stream.good()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to write to " + filePath.string()});
    }
    ++written;
    return {};
}

} // namespace CT::IO
