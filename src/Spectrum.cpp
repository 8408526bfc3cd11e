#include "fluxbin/Spectrum.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fluxbin {

namespace {

// ----------------------------------------------------------------------------
//  Read an ASCII table with N columns of doubles, skip comment lines
// ----------------------------------------------------------------------------
std::vector<std::array<double, 3>>
read_ascii_table(const std::string& path,
                 int  ncols,                        // 2 or 3
                 char comment_char = '#')
{
    if (ncols < 2 || ncols > 3)
        throw std::invalid_argument("read_ascii_table: ncols must be 2 or 3");

    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    std::vector<std::array<double,3>> rows;
    std::string line;
    while (std::getline(in, line))
    {
        auto it = std::find_if_not(line.begin(), line.end(),
                                   [](unsigned char c) { return std::isspace(c); });
        if (it == line.end()) continue;           // blank line
        if (*it == comment_char) continue;        // comment

        std::istringstream ss(line);
        std::array<double,3> row{0.0, 0.0, std::numeric_limits<double>::quiet_NaN()};

        if (ncols == 2) {
            if (!(ss >> row[0] >> row[1])) continue;
        } else {
            if (!(ss >> row[0] >> row[1] >> row[2])) continue;
        }
        rows.push_back(row);
    }
    if (rows.empty())
        throw std::runtime_error("File '" + path + "' contains no valid data");

    return rows;
}

} // anonymous namespace

Spectrum load_ascii(const std::string& path, int columns)
{
    const auto rows = read_ascii_table(path, columns);
    const auto n    = static_cast<Eigen::Index>(rows.size());

    Spectrum s;
    s.x.resize(n);
    s.y.resize(n);
    if (columns == 3) s.err.resize(n);

    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& r = rows[static_cast<std::size_t>(i)];
        s.x[i] = r[0];
        s.y[i] = r[1];
        if (columns == 3) s.err[i] = r[2];
    }
    return s;
}

void write_ascii(const std::string& path,
                 const Vector&      edges,
                 const Vector&      y,
                 const Vector&      err)
{
    if (edges.size() != y.size() + 1)
        throw std::invalid_argument("write_ascii: need one more edge than values");

    std::ofstream out(path);
    if (!out)
        throw std::runtime_error("Cannot write '" + path + "'");

    const bool with_err = err.size() == y.size() && err.size() > 0;

    out << "# x_lo x_hi y" << (with_err ? " err" : "") << '\n';
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (Eigen::Index k = 0; k < y.size(); ++k) {
        out << edges[k] << ' ' << edges[k + 1] << ' ' << y[k];
        if (with_err) out << ' ' << err[k];
        out << '\n';
    }
}

} // namespace fluxbin
