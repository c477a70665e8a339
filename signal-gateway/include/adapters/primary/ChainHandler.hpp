// adapters/primary/ChainHandler.hpp
#pragma once
#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include <memory>
#include <vector>
#include <iostream>
#include <nlohmann/json.hpp>

namespace serverlib
{

    /**
     * @brief Последовательный вызов handler'ов до первого выставленного статуса
     *
     * Middleware оставляют статус нулевым, конечный handler его выставляет.
     */
    class ChainHandler : public IHttpHandler
    {
    public:
        template <typename... Handlers>
        explicit ChainHandler(Handlers &&...handlers)
        {
            (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
        }

        void handle(IRequest &req, IResponse &res) override
        {
            for (auto &h : handlers_)
            {
                h->handle(req, res);
                if (res.getStatus() != 0)
                    return;
            }

            std::cerr << "[ChainHandler] Error: chain finished with zero status" << std::endl;
            nlohmann::json error;
            error["status"] = "error";
            error["message"] = "Internal server error";
            res.setResult(500, "application/json", error.dump());
        }

    private:
        std::vector<std::shared_ptr<IHttpHandler>> handlers_;
    };

} // namespace serverlib
