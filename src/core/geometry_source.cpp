#include "geometry_source.hpp"

#include <utility>

namespace geoplot::core {

VectorSource::VectorSource(std::vector<GeometryRecord> records) : records_(std::move(records)) {}

void VectorSource::add(GeometryRecord record) {
    records_.push_back(std::move(record));
}

bool VectorSource::next(GeometryRecord& record) {
    if (cursor_ >= records_.size()) {
        return false;
    }
    record = records_[cursor_++];
    return true;
}

void VectorSource::rewind() {
    cursor_ = 0;
}

} // namespace geoplot::core
