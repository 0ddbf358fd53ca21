//==============================================================================
// OutputWriter.cpp
// Simple utility class for persisting simulation results to disk.
//------------------------------------------------------------------------------
// Formats:
//   • mat_real : CSV-like rows with comma separation
//   • json     : direct dump using nlohmann::json (complex arrays already
//                split into {"shape", "real", "imag"} by the caller)
//==============================================================================

#include "OutputWriter.hpp"

//------------------------------------------------------------------------------
// Write a real-valued matrix to text file in CSV format (comma-separated).
// One row per line; empty rows are written as empty lines.
//------------------------------------------------------------------------------
void OutputWriter::writeMatrix(const std::string& filename, const mat_real& data)
{
    std::ofstream outfile(filename, std::ios::out);
    if (!outfile)
    {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }

    outfile << std::setprecision(16);
    for (const auto& row : data)
    {
        for (size_t j=0; j<row.size(); ++j)
        {
            outfile << row[j] << ((j+1 < row.size()) ? ", " : "");
        }
        outfile << std::endl;
    }
}

//------------------------------------------------------------------------------
// Write a JSON dictionary to file using nlohmann::json serialisation.
//------------------------------------------------------------------------------
void OutputWriter::writeJsonToFile(const std::string& filename, const json& dictionary, int indent)
{
    std::ofstream outputfile(filename);
    if (!outputfile)
    {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }

    outputfile << dictionary.dump(indent);
}
