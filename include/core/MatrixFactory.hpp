#pragma once
/** @file  MatrixFactory.hpp
 *  @brief Builds a connected MatrixSwitch from a DriverConfig.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <memory>

// 3rd-party headers
#include <boost/asio/io_context.hpp>

// Avior headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/MatrixSwitch.hpp"

namespace avior::core {

  /// Open the port and return a ready switch; throws ConnectionError if the port won't open.
  /// A non-empty `config.traceLog` starts a trace run when \p logger is null.
  std::unique_ptr<BlockingMatrixSwitch> openBlockingSwitch(const DriverConfig& config,
                                                           std::shared_ptr<ErrorMonitor> errorMonitor,
                                                           std::shared_ptr<Logger> logger = nullptr);

  /// Start opening the port on \p io.  Transactions wait for the link to come up and throw
  /// ConnectionError if it never does.
  std::unique_ptr<AsyncMatrixSwitch> openAsyncSwitch(boost::asio::io_context& io,
                                                     const DriverConfig& config,
                                                     std::shared_ptr<ErrorMonitor> errorMonitor,
                                                     std::shared_ptr<Logger> logger = nullptr);

} // namespace avior::core
