#include <anycard/qt_util.hpp>

#include <QString>

QString ToQString(const std::string& string)
{
    return QString::fromStdString(string);
}

QString ToQString(const std::string_view string_view)
{
    return QString::fromUtf8(string_view.data(), static_cast<qsizetype>(string_view.size()));
}

QString ToQString(const fs::path& path)
{
    return ToQString(path.string());
}
