#pragma once

#include "geometry_record.hpp"

#include <cstddef>
#include <vector>

namespace geoplot::core {

// Sequential reader of feature geometries (a file layer, a query result...).
class GeometrySource {
public:
    virtual ~GeometrySource() = default;

    // Fills `record` with the next geometry. Returns false at the end.
    virtual bool next(GeometryRecord& record) = 0;

    // Restarts reading from the first geometry.
    virtual void rewind() = 0;
};

// Source over records held in memory.
class VectorSource : public GeometrySource {
public:
    VectorSource() = default;
    explicit VectorSource(std::vector<GeometryRecord> records);

    void add(GeometryRecord record);

    bool next(GeometryRecord& record) override;
    void rewind() override;

    [[nodiscard]] std::size_t size() const { return records_.size(); }

private:
    std::vector<GeometryRecord> records_;
    std::size_t cursor_ = 0;
};

} // namespace geoplot::core
