#ifndef STRATA_FDM_GEOMETRY_H
#define STRATA_FDM_GEOMETRY_H

#include <cmath>
#include <vector>

namespace strata {
namespace fdm {

/**
 * Represents a 2D point with x and y coordinates
 */
struct Point2D {
    double x;
    double y;

    Point2D(double _x = 0, double _y = 0) : x(_x), y(_y) {}

    // Calculate distance to another point
    double distanceTo(const Point2D& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        return std::sqrt(dx*dx + dy*dy);
    }

    bool operator==(const Point2D& other) const {
        // Using small epsilon for floating point comparison
        const double epsilon = 1e-6;
        return std::fabs(x - other.x) < epsilon && std::fabs(y - other.y) < epsilon;
    }
};

/**
 * Mesh vertex in model space
 */
struct Point3D {
    double x, y, z;

    Point3D() : x(0), y(0), z(0) {}
    Point3D(double x, double y, double z) : x(x), y(y), z(z) {}

    Point3D operator+(const Point3D& other) const {
        return Point3D(x + other.x, y + other.y, z + other.z);
    }

    Point3D operator-(const Point3D& other) const {
        return Point3D(x - other.x, y - other.y, z - other.z);
    }

    Point3D operator*(double scalar) const {
        return Point3D(x * scalar, y * scalar, z * scalar);
    }

    Point3D cross(const Point3D& other) const {
        return Point3D(
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        );
    }

    double magnitude() const {
        return std::sqrt(x * x + y * y + z * z);
    }

    // Projection onto the XY plane
    Point2D xy() const {
        return Point2D(x, y);
    }
};

using Vertex = Point3D;

/**
 * Mesh facet, exactly three vertices
 */
struct Triangle {
    Vertex vertices[3];

    Triangle() {}
    Triangle(const Vertex& v1, const Vertex& v2, const Vertex& v3) {
        vertices[0] = v1;
        vertices[1] = v2;
        vertices[2] = v3;
    }

    // Twice the facet area is below the tolerance
    bool isDegenerate(double tolerance = 1e-9) const;
};

/**
 * Axis aligned bounds of a point set
 */
struct BoundingBox {
    Point3D min, max;
    bool defined;

    BoundingBox() : defined(false) {}

    void update(const Point3D& point);

    Point3D getSize() const {
        return max - min;
    }
};

/**
 * One clean plane crossing of a triangle
 */
struct Segment {
    Point2D start;
    Point2D end;

    Segment() = default;
    Segment(const Point2D& s, const Point2D& e) : start(s), end(e) {}
};

/**
 * Cross-section of the mesh at one plane height.
 * Segments are unordered and may be empty.
 */
struct Layer {
    double z;
    std::vector<Segment> segments;

    explicit Layer(double height = 0.0) : z(height) {}

    bool empty() const { return segments.empty(); }
};

/**
 * Ordered sequence of points the tool visits for one layer
 */
class Toolpath {
public:
    Toolpath() = default;
    explicit Toolpath(const std::vector<Point2D>& points) : m_points(points) {}

    void addPoint(const Point2D& point) {
        m_points.push_back(point);
    }

    const std::vector<Point2D>& getPoints() const {
        return m_points;
    }

    const Point2D& getPoint(size_t index) const {
        return m_points.at(index);
    }

    size_t size() const {
        return m_points.size();
    }

    bool empty() const {
        return m_points.empty();
    }

    // Sum of the straight moves between consecutive points
    double length() const;

private:
    std::vector<Point2D> m_points;
};

} // namespace fdm
} // namespace strata

#endif // STRATA_FDM_GEOMETRY_H
