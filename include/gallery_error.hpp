// ============================================================================
//  File: include/gallery_error.hpp — Taxonomie d’erreurs (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  OBJET
//  -----
//  • Un seul type d’erreur pour toutes les opérations: genre + message.
//  • Convention d’appel (identique aux adaptateurs I/O):
//        bool op(..., GalleryError* err = nullptr);
//    false ⇒ *err rempli si non nul.
//  • NotFound d’un profil: `available` liste les profils connus.
// ============================================================================

#pragma once
#include <string>
#include <vector>

namespace EinkGallery
{

enum class ErrorKind : unsigned char
{
    None = 0,
    NotFound,
    InvalidConfig,
    InvalidName,
    AlreadyExists,
    DecodeError,
    IOFailure,
    InvalidArgument,
    Internal
};

struct GalleryError
{
    ErrorKind   kind = ErrorKind::None;
    std::string message;
    std::vector<std::string> available; // NotFound profil uniquement
};

inline const char* error_kind_name(ErrorKind k)
{
    switch(k)
    {
    case ErrorKind::None:
        return "None";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::InvalidConfig:
        return "InvalidConfig";
    case ErrorKind::InvalidName:
        return "InvalidName";
    case ErrorKind::AlreadyExists:
        return "AlreadyExists";
    case ErrorKind::DecodeError:
        return "DecodeError";
    case ErrorKind::IOFailure:
        return "IOFailure";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    default:
        return "Internal";
    }
}

// Remplit *err si fourni, renvoie toujours false (pour `return fail(...)`).
inline bool fail(GalleryError* err, ErrorKind kind, const std::string& msg)
{
    if(err)
    {
        err->kind = kind;
        err->message = msg;
        err->available.clear();
    }
    return false;
}

} // namespace EinkGallery
