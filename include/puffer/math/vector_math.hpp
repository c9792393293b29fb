/**
 * @file vector_math.hpp
 * @brief 2D vector and position primitives for playfield geometry
 *
 * Playfield space is measured in pixels with the origin at the top-left
 * corner, x growing to the right and y growing downwards.
 */

#ifndef PUFFER_VECTOR_MATH_HPP
#define PUFFER_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Threshold for floating-point equality tests
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon = EPSILON);

/**
 * @brief Represents a point on the playfield
 */
class Position {
public:
    double x;  ///< X coordinate (pixels)
    double y;  ///< Y coordinate (pixels)

    /** @brief Constructs a Position at (0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    /** @brief Converts Position to Vector */
    operator Vector() const;

    Position operator+(const Vector& v) const;
    Position operator-(const Vector& v) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    Position& operator+=(const Vector& v);
};

/**
 * @brief Represents a 2D displacement or velocity
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /**
     * @brief Builds a vector of the given length pointing along an angle
     * @param angle Direction in radians (0 = +x, pi/2 = +y, i.e. downwards)
     * @param length Vector magnitude
     */
    static Vector fromAngle(double angle, double length);

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns normalized vector (length = 1), or +x for a zero vector */
    Vector normalized() const;

    Vector& operator+=(const Vector& v);
};

#endif // PUFFER_VECTOR_MATH_HPP
