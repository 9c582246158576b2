/* @file MatrixFactory.cpp
 * @brief config → session → facade wiring for both execution models
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// Avior headers
#include "core/MatrixFactory.hpp"
#include "io/AsyncLink.hpp"
#include "io/PortLocator.hpp"
#include "io/SerialChannel.hpp"

namespace avior::core {

  namespace {

    std::shared_ptr<Logger> traceLoggerFor(const DriverConfig& config, std::shared_ptr<Logger> logger) {
      if (logger || config.traceLog.empty())
        return logger;
      auto created = std::make_shared<Logger>();
      created->startNewRun(config.traceLog);
      return created;
    }

  } // namespace

  std::unique_ptr<BlockingMatrixSwitch> openBlockingSwitch(const DriverConfig& config,
                                                           std::shared_ptr<ErrorMonitor> errorMonitor,
                                                           std::shared_ptr<Logger> logger) {
    auto matrix = std::make_unique<BlockingMatrixSwitch>(
        std::make_unique<io::SerialChannel>(), io::parseLocator(config.port), config.timeout,
        std::move(errorMonitor), traceLoggerFor(config, std::move(logger)));
    matrix->session().connect();
    return matrix;
  }

  std::unique_ptr<AsyncMatrixSwitch> openAsyncSwitch(boost::asio::io_context& io,
                                                     const DriverConfig& config,
                                                     std::shared_ptr<ErrorMonitor> errorMonitor,
                                                     std::shared_ptr<Logger> logger) {
    auto matrix = std::make_unique<AsyncMatrixSwitch>(
        io, io::makeAsyncLink(io, io::parseLocator(config.port), config.timeout), config.timeout,
        std::move(errorMonitor), traceLoggerFor(config, std::move(logger)));
    matrix->session().connect();
    return matrix;
  }

} // namespace avior::core
