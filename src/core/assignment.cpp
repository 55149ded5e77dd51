#include "core/assignment.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace pcc {

// Classic O(n^2 m) Kuhn-Munkres on a dense n x m matrix, n <= m. 1-based internally, column 0 is the virtual start
static std::vector<int> SolveRowsLeCols(const CostMatrix& a) {
  const int n = static_cast<int>(a.size());
  const int m = static_cast<int>(a[0].size());
  const double inf = std::numeric_limits<double>::max();

  std::vector<double> u(n + 1, 0.0), v(m + 1, 0.0), minv(m + 1, inf);
  std::vector<int> p(m + 1, 0), way(m + 1, 0);
  std::vector<char> used(m + 1, 0);

  for (int i = 1; i <= n; ++i) {
    p[0] = i;
    int j0 = 0;
    std::fill(minv.begin(), minv.end(), inf);
    std::fill(used.begin(), used.end(), 0);

    do {
      used[j0] = 1;
      const int i0 = p[j0];
      double delta = inf;
      int j1 = 0;

      for (int j = 1; j <= m; ++j) {
        if (used[j]) continue;
        const double cur = a[i0 - 1][j - 1] - u[i0] - v[j];
        if (cur < minv[j]) {
          minv[j] = cur;
          way[j] = j0;
        }
        if (minv[j] < delta) {
          delta = minv[j];
          j1 = j;
        }
      }

      for (int j = 0; j <= m; ++j) {
        if (used[j]) {
          u[p[j]] += delta;
          v[j] -= delta;
        } else {
          minv[j] -= delta;
        }
      }
      j0 = j1;
    } while (p[j0] != 0);

    // Walk the augmenting path back to the start column
    do {
      const int j1 = way[j0];
      p[j0] = p[j1];
      j0 = j1;
    } while (j0 != 0);
  }

  std::vector<int> row_to_col(n, -1);
  for (int j = 1; j <= m; ++j) {
    if (p[j] != 0) row_to_col[p[j] - 1] = j - 1;
  }
  return row_to_col;
}

std::vector<int> SolveAssignment(const CostMatrix& cost) {
  const std::size_t rows = cost.size();
  if (rows == 0) return {};
  const std::size_t cols = cost[0].size();
  if (cols == 0) return std::vector<int>(rows, -1);

  // Infeasible pairs get a cost larger than any complete set of feasible pairs, so the solver
  // only takes one when it has nothing else left for that row
  double feasible_total = 0.0;
  for (const auto& r : cost) {
    for (double c : r) {
      if (std::isfinite(c)) feasible_total += std::abs(c);
    }
  }
  const double forbidden = 1.0 + 2.0 * feasible_total;

  const bool transpose = rows > cols;
  const std::size_t n = transpose ? cols : rows;
  const std::size_t m = transpose ? rows : cols;

  CostMatrix a(n, std::vector<double>(m, forbidden));
  for (std::size_t r = 0; r < rows; ++r) {
    for (std::size_t c = 0; c < cols; ++c) {
      const double x = cost[r][c];
      const double val = std::isfinite(x) ? x : forbidden;
      if (transpose) a[c][r] = val;
      else a[r][c] = val;
    }
  }

  const std::vector<int> solved = SolveRowsLeCols(a);

  std::vector<int> assignment(rows, -1);
  for (std::size_t i = 0; i < n; ++i) {
    const int j = solved[i];
    if (j < 0) continue;
    const std::size_t r = transpose ? static_cast<std::size_t>(j) : i;
    const std::size_t c = transpose ? i : static_cast<std::size_t>(j);
    if (std::isfinite(cost[r][c])) assignment[r] = static_cast<int>(c);
  }
  return assignment;
}

} // namespace pcc
