#include "result_writer.hpp"
#include <fstream>
#include <iomanip>

namespace ResultWriter {

bool write_csv(const std::string& path, const MembraneSolver::SolverResult& result) {
    std::ofstream out(path);
    if (!out) return false;

    out << "step;ex;ey;gxy;fx;fy;fxy;ec1;ec2;theta1e;fc1;fc2;theta1f\n";
    out << std::setprecision(10);

    for (const auto& s : result.steps) {
        const auto& e  = s.average_strains;
        const auto& f  = s.average_stresses;
        const auto& ec = s.concrete_principal_strains;
        const auto& fc = s.concrete_principal_stresses;
        out << s.step << ';'
            << e.ex << ';' << e.ey << ';' << e.gxy << ';'
            << f.sx << ';' << f.sy << ';' << f.txy << ';'
            << ec.e1 << ';' << ec.e2 << ';' << PlaneAlgebra::to_degrees(ec.theta1) << ';'
            << fc.s1 << ';' << fc.s2 << ';' << PlaneAlgebra::to_degrees(fc.theta1) << '\n';
    }

    return static_cast<bool>(out);
}

} // namespace ResultWriter
