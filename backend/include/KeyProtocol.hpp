#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace keystone {

class KeyGenerator;

/**
 * @brief JSON-RPC message handling for the key service.
 *
 * Request:  {"type":"rpc","id":...,"method":...,"params":{...}}
 * Response: {"type":"rpc_result","id":...,"ok":bool,"result"|"error":...}
 */
class KeyProtocol {
public:
    explicit KeyProtocol(const KeyGenerator& generator);

    nlohmann::json build_info_message() const;
    // never throws; failures become ok=false replies
    nlohmann::json handle_rpc(const nlohmann::json& request) const;

private:
    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params) const;
    nlohmann::json do_generate(const nlohmann::json& params) const;
    nlohmann::json do_cipher(const nlohmann::json& params, bool encrypting) const;

    const KeyGenerator& generator;
};

} // namespace keystone
