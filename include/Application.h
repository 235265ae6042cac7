// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef APPLICATION_H
#define APPLICATION_H

#include <cstddef>
#include <string>
#include <vector>

namespace flowscale
{
struct RunOptions;
struct RunStats;
struct ScalingConfig;

/*!
 * A singleton class that serves as the starting point of a run.
 *
 * It sets up logging, resolves the configuration from the command line and
 * the environment, rewrites the g-code and reports what happened. Errors are
 * logged and turned into the exit code of the process.
 */
class Application
{
public:
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /*!
     * Gets the instance of this application class.
     */
    static Application& getInstance();

    /*!
     * \brief Print to the stderr channel what the original call to the executable was.
     */
    void printCall() const;

    /*!
     * \brief Print how to use flow_scale.
     */
    void printHelp() const;

    /*!
     * \brief Print the version and license to the stderr channel.
     */
    void printLicense() const;

    /*!
     * \brief Starts the application.
     *
     * \param argc The number of arguments provided to the application.
     * \param argv The arguments provided to the application.
     * \return The exit code: 0 on success, otherwise the exit code of the error
     * that stopped the run.
     */
    int run(const size_t argc, char** argv);

private:
    /*!
     * \brief The arguments the application was called with, including the
     * name of the executable.
     */
    std::vector<std::string> arguments_;

    /*!
     * \brief Constructs a new Application instance.
     *
     * You cannot call this because this goes via the getInstance() function.
     */
    Application();

    ~Application() = default;

    /*!
     * \brief Rewrite the input to the output and report on it.
     */
    RunStats rewrite(const ScalingConfig& config, const RunOptions& options) const;
};

} // namespace flowscale

#endif // APPLICATION_H
