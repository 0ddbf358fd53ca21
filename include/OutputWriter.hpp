#pragma once
/**
 * @file OutputWriter.hpp
 * @brief Static utility class for writing simulation results to files.
 *
 * @details
 * Provides simple convenience wrappers to persist simulation data
 * (trajectory records, phase-space slices) to disk in JSON or
 * human-readable text format. All functions are static and can be called
 * without instantiating the class.
 */

#include "common.hpp"

/**
 * @class OutputWriter
 * @brief Collection of static methods for file output.
 *
 * @section usage Usage
 * - Call OutputWriter::writeJsonToFile("run.json", record) for results.
 * - Call OutputWriter::writeMatrix("f.csv", f) for 2-D slices.
 */
class OutputWriter
{
  public:
    /**
     * @brief Write a matrix of reals to a text file.
     * @param filename Path to output file.
     * @param data     2D matrix of real values.
     *
     * @details
     * Each row is written on one line, values separated by commas.
     * @throws std::runtime_error if the file cannot be opened.
     */
    static void writeMatrix(const std::string& filename, const mat_real& data);

    /**
     * @brief Write a JSON dictionary to a file.
     * @param filename   Path to output file.
     * @param dictionary JSON object.
     * @param indent     Indentation width, negative for the compact form.
     * @throws std::runtime_error if the file cannot be opened.
     */
    static void writeJsonToFile(const std::string& filename, const json& dictionary, int indent = -1);
};
