#include "store.hpp"
#include "server.hpp"
#include "http_server.hpp"
#include "snapshot.hpp"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <kj/main.h>
#include <kj/debug.h>
#include <filesystem>
#include <cstring>
#include <unistd.h>

class QuasardApp
{
public:
  explicit QuasardApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "Quasar in-memory property graph server using capnproto RPC")
        .addOption({'v'}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'b', "bind"}, KJ_BIND_METHOD(*this, optBind),
                          "bind", "bind address (e.g., unix:/tmp/quasar.sock or 0.0.0.0:0)")
        .addOptionWithArg({'s', "snapshot"}, KJ_BIND_METHOD(*this, optSnapshot),
                          "file", "snapshot file loaded at startup and written by save (default: disabled)")
        .addOptionWithArg({'H', "http"}, KJ_BIND_METHOD(*this, optHttp),
                          "http", "HTTP bind (e.g., http://0.0.0.0:8080, default: disabled)")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext &context_;
  bool verbose_ = false;
  kj::String bind_ = kj::heapString("unix:/tmp/quasar.sock");
  kj::String snapshotPath_ = kj::heapString("");
  kj::String httpBind_ = kj::heapString("");

  kj::MainBuilder::Validity optVerbose()
  {
    verbose_ = true;
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optBind(kj::StringPtr value)
  {
    bind_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optSnapshot(kj::StringPtr value)
  {
    snapshotPath_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optHttp(kj::StringPtr value)
  {
    httpBind_ = kj::heapString(value);
    return true;
  }

  void loadSnapshot(quasar::Store &store, const std::string &path)
  {
    if (path.empty() || !std::filesystem::exists(path))
      return;
    try
    {
      quasar::snapshot::loadFromFile(store, path);
    }
    catch (const quasar::GraphError &e)
    {
      // serve an empty graph; the next save overwrites the bad file
      KJ_LOG(WARNING, "snapshot not loaded", e.what());
    }
  }

  kj::MainBuilder::Validity run()
  {
    try
    {
      quasar::Store store;
      std::string snapshotPath(snapshotPath_.cStr());
      loadSnapshot(store, snapshotPath);

      const char *bindC = bind_.cStr();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        const char *path = bindC + 5;
        ::unlink(path);
      }

      if (httpBind_.size() > 0)
      {
        quasar::http::startHttpServer(store, std::string(httpBind_.cStr()), snapshotPath);
        KJ_LOG(INFO, "http server listening on ", httpBind_);
      }

      capnp::EzRpcServer server(kj::heap<quasar::rpc::QuasarImpl>(store, snapshotPath), bindC);
      auto &waitScope = server.getWaitScope();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        KJ_LOG(INFO, "quasard listening on ", bindC);
      }
      else
      {
        auto addr = server.getPort().wait(waitScope);
        KJ_LOG(INFO, "quasard listening on ", bindC, " (port ", addr, ")");
      }
      kj::NEVER_DONE.wait(waitScope);
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "fatal: ", e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    return true;
  }
};

KJ_MAIN(QuasardApp);
