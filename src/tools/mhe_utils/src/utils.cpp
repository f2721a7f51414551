// Copyright 2023 Haoru Xue
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include <map>
#include <string>
#include <vector>

#include "mhe_utils/utils.hpp"

namespace mhe
{
namespace utils
{
namespace
{
casadi::SX segment(const casadi::SX & v, const casadi_int & offset, const casadi_int & size)
{
  if (size == 0) {
    return casadi::SX::zeros(0, 1);
  }
  return v(casadi::Slice(offset, offset + size));
}
}  // namespace

bool depends_only_on(
  const casadi::SX & expr, const std::vector<casadi::SX> & allowed,
  std::vector<std::string> & offending)
{
  offending.clear();
  std::vector<casadi::SX> allowed_symbols;
  for (const auto & a : allowed) {
    const auto symbols = casadi::SX::symvar(a);
    allowed_symbols.insert(allowed_symbols.end(), symbols.begin(), symbols.end());
  }
  for (const auto & s : casadi::SX::symvar(expr)) {
    bool found = false;
    for (const auto & a : allowed_symbols) {
      if (casadi::SX::is_equal(s, a)) {
        found = true;
        break;
      }
    }
    if (!found) {
      offending.push_back(s.name());
    }
  }
  return offending.empty();
}

void collocation_coefficients(
  const std::vector<double> & tau_root,
  std::vector<std::vector<double>> & C,
  std::vector<double> & D)
{
  const auto n = tau_root.size();
  C.assign(n, std::vector<double>(n, 0.0));
  D.assign(n, 0.0);
  for (size_t j = 0; j < n; j++) {
    // l_j(1)
    double l_j = 1.0;
    for (size_t r = 0; r < n; r++) {
      if (r != j) {
        l_j *= (1.0 - tau_root[r]) / (tau_root[j] - tau_root[r]);
      }
    }
    D[j] = l_j;

    // l_j'(tau_k) by the product rule
    for (size_t k = 0; k < n; k++) {
      double dl_j = 0.0;
      for (size_t m = 0; m < n; m++) {
        if (m == j) {
          continue;
        }
        double term = 1.0 / (tau_root[j] - tau_root[m]);
        for (size_t r = 0; r < n; r++) {
          if (r == j || r == m) {
            continue;
          }
          term *= (tau_root[k] - tau_root[r]) / (tau_root[j] - tau_root[r]);
        }
        dl_j += term;
      }
      C[j][k] = dl_j;
    }
  }
}

casadi::Function collocation_function(
  const std::map<std::string, casadi_int> & n, const double & dt,
  const casadi_int & deg, const casadi_int & ni,
  const std::string & collocation_type,
  const casadi::Function & rhs, const casadi::Function & alg)
{
  using casadi::SX;
  const auto nx = n.at("x");
  const auto nu = n.at("u");
  const auto nz = n.at("z");
  const auto ntvp = n.at("tvp");
  const auto np = n.at("p");

  auto tau_root = casadi::collocation_points(deg, collocation_type);
  tau_root.insert(tau_root.begin(), 0.0);
  std::vector<std::vector<double>> C;
  std::vector<double> D;
  collocation_coefficients(tau_root, C, D);

  const auto h = dt / static_cast<double>(ni);
  const auto n_points = ni * (deg + 1);

  const auto x0 = SX::sym("x0", nx, 1);
  const auto x_coll = SX::sym("x_coll", nx * n_points, 1);
  const auto u = SX::sym("u", nu, 1);
  const auto z = SX::sym("z", nz * (n_points + 1), 1);
  const auto tvp = SX::sym("tvp", ntvp, 1);
  const auto p = SX::sym("p", np, 1);

  // every point of the step, x0 first and the end of the step last
  std::vector<SX> x_pts{x0};
  for (casadi_int q = 0; q < n_points; q++) {
    x_pts.push_back(segment(x_coll, q * nx, nx));
  }
  std::vector<SX> z_pts;
  for (casadi_int q = 0; q <= n_points; q++) {
    z_pts.push_back(segment(z, q * nz, nz));
  }

  std::vector<SX> g;
  for (casadi_int i = 0; i < ni; i++) {
    const auto base = i * (deg + 1);
    for (casadi_int j = 1; j <= deg; j++) {
      auto xp_ij = SX::zeros(nx, 1);
      for (casadi_int r = 0; r <= deg; r++) {
        xp_ij += C[r][j] * x_pts[base + r];
      }
      const auto f_ij = rhs(
        casadi::SXDict{{"x", x_pts[base + j]}, {"u", u}, {"z", z_pts[base + j]},
          {"tvp", tvp}, {"p", p}}).at("rhs");
      g.push_back(h * f_ij - xp_ij);
    }

    // continuity to the first point of the next element
    auto xf_i = SX::zeros(nx, 1);
    for (casadi_int r = 0; r <= deg; r++) {
      xf_i += D[r] * x_pts[base + r];
    }
    g.push_back(x_pts[base + deg + 1] - xf_i);
  }

  if (nz > 0) {
    for (casadi_int q = 0; q <= n_points; q++) {
      g.push_back(
        alg(
          casadi::SXDict{{"x", x_pts[q]}, {"u", u}, {"z", z_pts[q]}, {"tvp", tvp},
            {"p", p}}).at("alg"));
    }
  }

  return casadi::Function(
    "collocation", {x0, x_coll, u, z, tvp, p}, {vertcat_column(g), x_pts.back()},
    {"x0", "x_coll", "u", "z", "tvp", "p"}, {"g", "xf"});
}

casadi::Function discrete_transition_function(
  const std::map<std::string, casadi_int> & n,
  const casadi::Function & rhs, const casadi::Function & alg)
{
  using casadi::SX;
  const auto x0 = SX::sym("x0", n.at("x"), 1);
  const auto x_coll = SX::sym("x_coll", 0, 1);
  const auto u = SX::sym("u", n.at("u"), 1);
  const auto z = SX::sym("z", n.at("z"), 1);
  const auto tvp = SX::sym("tvp", n.at("tvp"), 1);
  const auto p = SX::sym("p", n.at("p"), 1);
  const auto in = casadi::SXDict{{"x", x0}, {"u", u}, {"z", z}, {"tvp", tvp}, {"p", p}};

  const auto xf = rhs(in).at("rhs");
  const auto g = n.at("z") > 0 ? alg(in).at("alg") : SX::zeros(0, 1);
  return casadi::Function(
    "discrete_transition", {x0, x_coll, u, z, tvp, p}, {g, xf},
    {"x0", "x_coll", "u", "z", "tvp", "p"}, {"g", "xf"});
}
}  // namespace utils
}  // namespace mhe
