#include "warpcore/math/Math.h"
#include "warpcore/math/Quat.h"
#include "warpcore/math/Vec3.h"

#include <cmath>
#include <iostream>

static bool approx(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

static bool approxVec(const warpcore::math::Vec3d& a, const warpcore::math::Vec3d& b, double eps = 1e-9) {
  return approx(a.x, b.x, eps) && approx(a.y, b.y, eps) && approx(a.z, b.z, eps);
}

int test_math() {
  int fails = 0;

  using namespace warpcore::math;

  // Frame convention: forward -Z, right +X, up +Y.
  {
    const Quatd q = Quatd::identity();
    if (!approxVec(q.forward(), {0, 0, -1}) || !approxVec(q.right(), {1, 0, 0}) || !approxVec(q.up(), {0, 1, 0})) {
      std::cerr << "[test_math] identity basis wrong: fwd=" << q.forward() << " right=" << q.right() << "\n";
      ++fails;
    }
  }

  // Positive yaw turns left.
  {
    const Quatd q = Quatd::fromEuler({0.0, halfPi, 0.0});
    if (!approxVec(q.forward(), {-1, 0, 0})) {
      std::cerr << "[test_math] yaw +90 forward expected (-1,0,0) got " << q.forward() << "\n";
      ++fails;
    }
  }

  // Positive pitch raises the nose.
  {
    const Quatd q = Quatd::fromEuler({0.2, 0.0, 0.0});
    if (!(q.forward().y > 0.0)) {
      std::cerr << "[test_math] positive pitch should raise the nose, fwd=" << q.forward() << "\n";
      ++fails;
    }
  }

  // Euler round trip away from gimbal lock.
  {
    const EulerAngles in{0.3, -1.2, 0.2};
    const EulerAngles out = Quatd::fromEuler(in).toEuler();
    if (!approx(in.pitch, out.pitch, 1e-9) || !approx(in.yaw, out.yaw, 1e-9) || !approx(in.roll, out.roll, 1e-9)) {
      std::cerr << "[test_math] euler round trip mismatch: " << out.pitch << " " << out.yaw << " " << out.roll << "\n";
      ++fails;
    }

    const EulerAngles steep{degToRad(85.0), 0.4, 0.0};
    const EulerAngles back = Quatd::fromEuler(steep).toEuler();
    if (!approx(back.pitch, steep.pitch, 1e-7) || !approx(back.yaw, steep.yaw, 1e-7)) {
      std::cerr << "[test_math] steep pitch round trip mismatch\n";
      ++fails;
    }
  }

  // Euler and axis-angle agree for a pure yaw.
  {
    const Quatd a = Quatd::fromEuler({0.0, 0.7, 0.0});
    const Quatd b = Quatd::fromAxisAngle({0, 1, 0}, 0.7);
    if (angleBetween(a, b) > 1e-9) {
      std::cerr << "[test_math] fromEuler/fromAxisAngle disagree\n";
      ++fails;
    }
  }

  // lookRotation points local -Z at the target with +Y kept up.
  {
    const Quatd q = Quatd::lookRotation({1, 0, 0});
    if (!approxVec(q.forward(), {1, 0, 0}, 1e-9) || !approxVec(q.up(), {0, 1, 0}, 1e-9)) {
      std::cerr << "[test_math] lookRotation(+X) fwd=" << q.forward() << " up=" << q.up() << "\n";
      ++fails;
    }

    const Quatd back = Quatd::lookRotation({0, 0, 5});
    if (!approxVec(back.forward(), {0, 0, 1}, 1e-9)) {
      std::cerr << "[test_math] lookRotation(+Z) fwd=" << back.forward() << "\n";
      ++fails;
    }

    const Quatd ahead = Quatd::lookRotation({0, 0, -3});
    if (angleBetween(ahead, Quatd::identity()) > 1e-9) {
      std::cerr << "[test_math] lookRotation(-Z) should be identity\n";
      ++fails;
    }

    const Quatd diag = Quatd::lookRotation({1, 2, -3});
    if (!approxVec(diag.forward(), Vec3d{1, 2, -3}.normalized(), 1e-9)) {
      std::cerr << "[test_math] lookRotation(diagonal) fwd=" << diag.forward() << "\n";
      ++fails;
    }
  }

  // Slerp endpoints, midpoint and shortest path.
  {
    const Quatd a = Quatd::fromEuler({0.0, 0.0, 0.0});
    const Quatd b = Quatd::fromEuler({0.0, 1.0, 0.0});

    if (angleBetween(Quatd::slerp(a, b, 0.0), a) > 1e-9 || angleBetween(Quatd::slerp(a, b, 1.0), b) > 1e-9) {
      std::cerr << "[test_math] slerp endpoints wrong\n";
      ++fails;
    }

    const EulerAngles mid = Quatd::slerp(a, b, 0.5).toEuler();
    if (!approx(mid.yaw, 0.5, 1e-9)) {
      std::cerr << "[test_math] slerp midpoint yaw expected 0.5 got " << mid.yaw << "\n";
      ++fails;
    }

    const Quatd negB{-b.w, -b.x, -b.y, -b.z};
    if (angleBetween(Quatd::slerp(a, negB, 0.5), Quatd::slerp(a, b, 0.5)) > 1e-9) {
      std::cerr << "[test_math] slerp should take the shortest path\n";
      ++fails;
    }
  }

  // Hamilton product composes rotations.
  {
    const Quatd y = Quatd::fromAxisAngle({0, 1, 0}, halfPi);
    const Quatd twice = y * y;
    if (!approxVec(twice.rotate({0, 0, -1}), {0, 0, 1}, 1e-9)) {
      std::cerr << "[test_math] two quarter turns should face backwards\n";
      ++fails;
    }
  }

  // Frame-rate independent smoothing.
  {
    const double rate = rateFromFrameFactor(0.24, 60.0);
    if (!approx(smoothingAlpha(rate, 1.0 / 60.0), 0.24, 1e-12)) {
      std::cerr << "[test_math] rateFromFrameFactor does not invert smoothingAlpha\n";
      ++fails;
    }

    // Two half steps land where one full step does.
    const double full = smoothingAlpha(rate, 0.1);
    const double half = smoothingAlpha(rate, 0.05);
    const double twoHalves = 1.0 - (1.0 - half) * (1.0 - half);
    if (!approx(full, twoHalves, 1e-12)) {
      std::cerr << "[test_math] smoothing depends on step size\n";
      ++fails;
    }

    if (smoothingAlpha(0.0, 0.1) != 0.0 || smoothingAlpha(5.0, 0.0) != 0.0) {
      std::cerr << "[test_math] smoothingAlpha should be 0 for zero rate or dt\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_math] pass\n";
  return fails;
}
