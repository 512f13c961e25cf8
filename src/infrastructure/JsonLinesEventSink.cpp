#include "infrastructure/JsonLinesEventSink.hpp"

#include <stdexcept>

namespace rcy::infrastructure {

JsonLinesEventSink::JsonLinesEventSink(std::ostream& out) : out_(out) {}

JsonLinesEventSink::JsonLinesEventSink(std::unique_ptr<std::ofstream> file)
    : file_(std::move(file))
    , out_(*file_) {}

std::unique_ptr<JsonLinesEventSink> JsonLinesEventSink::open_file(const std::string& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!*file) {
        throw std::runtime_error("Cannot open event log: " + path);
    }
    return std::make_unique<JsonLinesEventSink>(std::move(file));
}

void JsonLinesEventSink::publish(const rcy::domain::RecyclingEventVariant& event) {
    out_ << serializer_.to_json(event).dump() << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to write event");
    }
    ++published_;
}

} // namespace rcy::infrastructure
