//! # Library Model
//!
//! The parts of the introspected C-library model the analysis passes read:
//! the kind of the owning type, the fundamental value types of parameters
//! and returns, and ownership-transfer modes. The model is built upstream
//! from the introspection manifest; nothing here parses it.

#ifndef WRAPGEN_LIBRARY_HPP
#define WRAPGEN_LIBRARY_HPP

namespace wrapgen::library {

/// Category of the library type that owns a function list.
enum class TypeKind {
    Enumeration, ///< C enum with named values
    Bitfield,    ///< C flags enum
    Record,      ///< Plain or boxed struct
    Class,       ///< Reference-counted object class
    Other        ///< Interfaces, unions, aliases
};

/// True for the kinds whose stringify functions are trusted upstream and may
/// return static strings.
inline bool is_enumeration_like(TypeKind kind) {
    return kind == TypeKind::Enumeration || kind == TypeKind::Bitfield;
}

/// Fundamental type of a parameter or return value.
enum class ValueType {
    None,
    Boolean,
    Int32,
    UInt32,
    Int64,
    UInt64,
    Double,
    Utf8,     ///< NUL-terminated UTF-8 string
    Filename, ///< Platform file name encoding
    OsString, ///< Platform string encoding
    Pointer,
    Object
};

/// Ownership of a returned value.
enum class Transfer {
    None,      ///< Callee keeps ownership
    Container, ///< Caller owns the container but not its elements
    Full       ///< Caller owns the value
};

inline const char* type_kind_name(TypeKind kind) {
    switch (kind) {
    case TypeKind::Enumeration:
        return "enumeration";
    case TypeKind::Bitfield:
        return "bitfield";
    case TypeKind::Record:
        return "record";
    case TypeKind::Class:
        return "class";
    case TypeKind::Other:
        return "other";
    }
    return "unknown";
}

} // namespace wrapgen::library

#endif // WRAPGEN_LIBRARY_HPP
