/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <string>

namespace facebook { namespace pkgsweep {

/**
 * The bodies of the scripts that jobs feed to the runtime.  Every script
 * gets the package as JSON in its first argument, and finds its output
 * directory in $PKGSWEEP_OUTPUT.
 *
 *  - test: installs the package, writes the side channel markers, and
 *    runs the package's tests.
 *  - compile: builds a runtime image containing the package, at the path
 *    in its second argument.  Only needed for compiled configurations.
 *  - pack trace: after a traced crash, compresses the newest tracer
 *    recording into $PKGSWEEP_OUTPUT/<package>.tar.zst.
 *
 * An empty script means that the step is unsupported.
 */
class ScriptProvider {
public:
  virtual ~ScriptProvider() {}
  virtual const std::string& testScript() const = 0;
  virtual const std::string& compileScript() const = 0;
  virtual const std::string& packTraceScript() const = 0;
};

/**
 * Reads the scripts once, from the files "test", "compile" and
 * "pack_trace" in a directory.  Only "test" is required.
 */
class FileScriptProvider : public ScriptProvider {
public:
  explicit FileScriptProvider(const boost::filesystem::path& dir);

  const std::string& testScript() const override { return test_; }
  const std::string& compileScript() const override { return compile_; }
  const std::string& packTraceScript() const override { return packTrace_; }

private:
  std::string test_;
  std::string compile_;
  std::string packTrace_;
};

}}  // namespace facebook::pkgsweep
