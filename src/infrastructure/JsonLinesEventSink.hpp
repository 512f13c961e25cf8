#pragma once

#include "infrastructure/RecyclingEventSerializer.hpp"
#include "services/IRecyclingEventSink.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>

namespace rcy::infrastructure {

// Writes each observation as one line of JSON.
class JsonLinesEventSink : public rcy::services::IRecyclingEventSink {
public:
    explicit JsonLinesEventSink(std::ostream& out);
    explicit JsonLinesEventSink(std::unique_ptr<std::ofstream> file);

    // Appends to the file at path, creating it if needed.
    static std::unique_ptr<JsonLinesEventSink> open_file(const std::string& path);

    void publish(const rcy::domain::RecyclingEventVariant& event) override;

    uint64_t published_count() const noexcept { return published_; }

private:
    std::unique_ptr<std::ofstream> file_;
    std::ostream& out_;
    RecyclingEventSerializer serializer_;
    uint64_t published_{0};
};

} // namespace rcy::infrastructure
