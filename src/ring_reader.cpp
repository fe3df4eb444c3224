#include "geocut/ring_reader.hpp"

#include <zlib.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace geocut {

namespace {

/**
 * Owns a gzFile; gzopen reads uncompressed input transparently
 */
class GzReader {
public:
    explicit GzReader(const std::string& path) : path(path), file(gzopen(path.c_str(), "rb")) {
        if (file == nullptr) {
            throw std::runtime_error("Cannot open ring file " + path + ": " + std::strerror(errno));
        }
    }

    ~GzReader() {
        gzclose(file);
    }

    GzReader(const GzReader&) = delete;
    GzReader& operator=(const GzReader&) = delete;

    // False at end of file
    bool readLine(std::string& line) {
        line.clear();
        char buffer[4096];
        while (gzgets(file, buffer, sizeof(buffer)) != nullptr) {
            line += buffer;
            if (!line.empty() && line.back() == '\n') {
                line.pop_back();
                return true;
            }
        }

        int errorCode = Z_OK;
        const char* message = gzerror(file, &errorCode);
        if (errorCode != Z_OK && errorCode != Z_STREAM_END) {
            throw std::runtime_error("Error reading ring file " + path + ": " + message);
        }
        return !line.empty();
    }

private:
    std::string path;
    gzFile file;
};

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r";
    std::size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    std::size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

[[noreturn]] void failLine(const std::string& path, std::size_t lineNumber, const std::string& reason) {
    std::ostringstream message;
    message << path << ":" << lineNumber << ": " << reason;
    throw std::runtime_error(message.str());
}

} // namespace

RawRings readRings(const std::string& path) {
    GzReader reader(path);
    RawRings rings;
    RawRing current;

    std::string line;
    std::size_t lineNumber = 0;
    while (reader.readLine(line)) {
        lineNumber++;
        std::string content = trim(line);

        if (content.empty()) {
            if (!current.empty()) {
                rings.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        if (content[0] == '#') {
            continue;
        }

        std::istringstream fields(content);
        LatLon vertex;
        std::string extra;
        if (!(fields >> vertex.latitude >> vertex.longitude) || (fields >> extra)) {
            failLine(path, lineNumber, "expected \"latitude longitude\", got \"" + content + "\"");
        }
        if (vertex.latitude < -90.0 || vertex.latitude > 90.0) {
            failLine(path, lineNumber, "latitude out of range: " + content);
        }
        current.push_back(vertex);
    }

    if (!current.empty()) {
        rings.push_back(std::move(current));
    }
    return rings;
}

RingList readRings(const std::string& path, const PlanetModel& planetModel) {
    return toGeoPoints(readRings(path), planetModel);
}

RingList toGeoPoints(const RawRings& rawRings, const PlanetModel& planetModel) {
    RingList rings;
    rings.reserve(rawRings.size());
    for (const RawRing& rawRing : rawRings) {
        Ring ring;
        ring.reserve(rawRing.size());
        for (const LatLon& vertex : rawRing) {
            ring.push_back(GeoPoint::fromDegrees(planetModel, vertex.latitude, vertex.longitude));
        }
        rings.push_back(std::move(ring));
    }
    return rings;
}

} // namespace geocut
