#pragma once
#include "membrane_solver.hpp"
#include <string>

namespace ResultWriter {

// One row per converged step, semicolon separated. Angles in degrees.
// Columns: step;ex;ey;gxy;fx;fy;fxy;ec1;ec2;theta1e;fc1;fc2;theta1f
bool write_csv(const std::string& path, const MembraneSolver::SolverResult& result);

} // namespace ResultWriter
