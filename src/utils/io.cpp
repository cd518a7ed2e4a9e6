#include "smpsolib/utils/io.hpp"

namespace smpsolib::utils {

    static void WriteRows(std::ostream &out, const std::vector<core::TSol> &front,
                          std::vector<double> core::TSol::*field)
    {
        out << std::setprecision(10);
        for (const core::TSol &s : front) {
            const std::vector<double> &row = s.*field;
            for (std::size_t k = 0; k < row.size(); k++) {
                if (k > 0) out << '\t';
                out << row[k];
            }
            out << '\n';
        }
    }

    static std::ofstream OpenOutput(const std::string &fileName)
    {
        std::ofstream file(fileName);
        if (!file.is_open())
            throw std::runtime_error("Cannot open output file " + fileName);
        return file;
    }

    void WriteFrontScreen(const std::string &problemName, const std::vector<core::TSol> &front,
                          std::ostream &out)
    {
        out << "\nProblem: " << problemName
            << "\nFront size: " << front.size()
            << "\nObjectives:\n";

        std::ios_base::fmtflags flags = out.flags();
        std::streamsize precision = out.precision();
        out << std::fixed << std::setprecision(5);
        for (const core::TSol &s : front) {
            for (double value : s.obj)
                out << value << " ";
            out << "\n";
        }
        out.flags(flags);
        out.precision(precision);
    }

    void WriteFunctionValues(const std::string &fileName, const std::vector<core::TSol> &front)
    {
        std::ofstream file = OpenOutput(fileName);
        WriteRows(file, front, &core::TSol::obj);
    }

    void WriteVariables(const std::string &fileName, const std::vector<core::TSol> &front)
    {
        std::ofstream file = OpenOutput(fileName);
        WriteRows(file, front, &core::TSol::vars);
    }

} // namespace smpsolib::utils
