/* Small vector/matrix helpers shared by the encoder, sampler and scene code
 */

#ifndef TEXPACK_MATHLIB_HPP
#define TEXPACK_MATHLIB_HPP

#include <cmath>
#include <cstdint>

#include "texpack.hpp"

namespace texpack {

/* Helper structs and math */
struct Vec3f
{
    decimal x;
    decimal y;
    decimal z;

    inline Vec3f operator+(const Vec3f &other) const
    {
        return Vec3f {
            x + other.x,
            y + other.y,
            z + other.z,
        };
    }

    inline Vec3f operator-(const Vec3f &other) const
    {
        return Vec3f {
            x - other.x,
            y - other.y,
            z - other.z,
        };
    }

    inline Vec3f operator*(decimal a) const
    {
        return Vec3f {
            x * a,
            y * a,
            z * a,
        };
    }

    inline decimal dot(const Vec3f &other) const
    {
        return (x * other.x) + (y * other.y) + (z * other.z);
    }

    inline Vec3f cross(const Vec3f &other) const
    {
        return Vec3f {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x,
        };
    }

    inline Vec3f normalized() const
    {
        const decimal len = std::sqrt(dot(*this));
        if (len < EPSILON)
        {
            return *this;
        }
        return *this * (F(1.0) / len);
    }
};

/* Column-major 4x4 matrix, same memory order as glUniformMatrix4fv expects */
struct Mat4f
{
    float m[16];

    static inline Mat4f identity()
    {
        Mat4f r = {};
        r.m[0] = r.m[5] = r.m[10] = r.m[15] = 1.0f;
        return r;
    }

    inline float& at(int row, int col) { return m[col * 4 + row]; }
    inline float at(int row, int col) const { return m[col * 4 + row]; }

    inline Mat4f operator*(const Mat4f &other) const
    {
        Mat4f r = {};
        for (int col = 0; col < 4; ++col)
        {
            for (int row = 0; row < 4; ++row)
            {
                float acc = 0.0f;
                for (int k = 0; k < 4; ++k)
                {
                    acc += at(row, k) * other.at(k, col);
                }
                r.at(row, col) = acc;
            }
        }
        return r;
    }
};

/* OpenGL-style perspective projection, fov_y in radians */
inline Mat4f perspective(float fov_y, float aspect, float z_near, float z_far)
{
    const float f = 1.0f / std::tan(fov_y * 0.5f);

    Mat4f r = {};
    r.at(0, 0) = f / aspect;
    r.at(1, 1) = f;
    r.at(2, 2) = (z_far + z_near) / (z_near - z_far);
    r.at(2, 3) = (2.0f * z_far * z_near) / (z_near - z_far);
    r.at(3, 2) = -1.0f;
    return r;
}

/* Right-handed view matrix looking from eye towards center */
inline Mat4f look_at(const Vec3f &eye, const Vec3f &center, const Vec3f &up)
{
    const Vec3f f = (center - eye).normalized();
    const Vec3f s = f.cross(up).normalized();
    const Vec3f u = s.cross(f);

    Mat4f r = Mat4f::identity();
    r.at(0, 0) = (float)s.x;
    r.at(0, 1) = (float)s.y;
    r.at(0, 2) = (float)s.z;
    r.at(1, 0) = (float)u.x;
    r.at(1, 1) = (float)u.y;
    r.at(1, 2) = (float)u.z;
    r.at(2, 0) = (float)-f.x;
    r.at(2, 1) = (float)-f.y;
    r.at(2, 2) = (float)-f.z;
    r.at(0, 3) = (float)-s.dot(eye);
    r.at(1, 3) = (float)-u.dot(eye);
    r.at(2, 3) = (float)f.dot(eye);
    return r;
}

inline decimal fclamp(decimal a, decimal amin, decimal amax)
{
    const decimal min = a < amin ? amin : a;
    return min > amax ? amax : min;
}

inline int iclamp(int a, int amin, int amax)
{
    const int min = a < amin ? amin : a;
    return min > amax ? amax : min;
}

} // namespace texpack

#endif // TEXPACK_MATHLIB_HPP
