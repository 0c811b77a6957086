#ifndef DOCRES_ERROR_H
#define DOCRES_ERROR_H

#include <QString>

// DocRes 统一错误码：
// - 目标：调用方（排版流水线）能按类别决定跳过单个元素还是放弃整个文档。
// - 约定：
//   - ARC = 容器/条目读取
//   - REL = 关系表解析与查找
//   - FONT = 字体回退链
//   - COLOR = 颜色值格式
enum class DocResErrorCode
{
    None = 0,
    ContainerUnreadable,
    EntryNotFound,
    RelationshipParseError,
    RelationshipNotFound,
    FontLoadFailure,
    InvalidColorFormat,
};

inline QString docResErrorCodeTag(DocResErrorCode code)
{
    switch (code)
    {
    case DocResErrorCode::ContainerUnreadable: return QStringLiteral("DOCRES-ARC-001");
    case DocResErrorCode::EntryNotFound: return QStringLiteral("DOCRES-ARC-002");
    case DocResErrorCode::RelationshipParseError: return QStringLiteral("DOCRES-REL-001");
    case DocResErrorCode::RelationshipNotFound: return QStringLiteral("DOCRES-REL-002");
    case DocResErrorCode::FontLoadFailure: return QStringLiteral("DOCRES-FONT-001");
    case DocResErrorCode::InvalidColorFormat: return QStringLiteral("DOCRES-COLOR-001");
    case DocResErrorCode::None:
    default:
        break;
    }
    return QStringLiteral("DOCRES-UNKNOWN");
}

inline QString formatDocResError(DocResErrorCode code, const QString &message)
{
    if (code == DocResErrorCode::None) return message;
    return QStringLiteral("[%1] %2").arg(docResErrorCodeTag(code), message);
}

// 一次失败的类别与可读说明；code 为 None 表示没有错误。
struct DocResError
{
    DocResErrorCode code = DocResErrorCode::None;
    QString message;

    bool isError() const { return code != DocResErrorCode::None; }
    QString toString() const { return formatDocResError(code, message); }
};

// 统一写入可空的 error 输出参数，返回 false 便于 `return failWith(...)`。
inline bool failWith(DocResError *error, DocResErrorCode code, const QString &message)
{
    if (error)
    {
        error->code = code;
        error->message = message;
    }
    return false;
}

inline void clearError(DocResError *error)
{
    if (error) *error = DocResError();
}

#endif // DOCRES_ERROR_H
