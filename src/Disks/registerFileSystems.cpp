#include <Disks/registerFileSystems.h>

#include <Disks/FileSystemFactory.h>

#include <mutex>

namespace SSTIO
{

void registerLocalFileSystem(FileSystemFactory & factory);

void registerFileSystems()
{
    static std::once_flag registered;
    std::call_once(registered, []
    {
        auto & factory = FileSystemFactory::instance();
        registerLocalFileSystem(factory);
    });
}

}
