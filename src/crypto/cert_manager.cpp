#include <certkit/crypto/cert_manager.hpp>
#include <certkit/crypto/cert.hpp>
#include <certkit/crypto/exception.hpp>

#include <casket/utils/exception.hpp>

namespace fs = std::filesystem;

namespace certkit::crypto
{

CertManager::CertManager()
    : store_(X509_STORE_new())
{
    casket::ThrowIfTrue(store_ == nullptr, "memory allocation error");
}

CertManager::~CertManager() noexcept
{
}

CertManager& CertManager::addCA(X509Cert* cert)
{
    casket::ThrowIfTrue(cert == nullptr, "invalid argument");
    crypto::ThrowIfFalse(0 < X509_STORE_add_cert(store_, cert));
    return *this;
}

CertManager& CertManager::loadFile(const std::filesystem::path& path)
{
    fs::path caPath = fs::is_symlink(path) ? fs::read_symlink(path) : path;
    casket::ThrowIfFalse(fs::is_regular_file(caPath), "'" + path.string() + "' is not a file!");

    for (auto& cert : Cert::loadFile(path))
    {
        addCA(cert);
    }
    return *this;
}

X509Store* CertManager::certStore()
{
    return store_.get();
}

} // namespace certkit::crypto
