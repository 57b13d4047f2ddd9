/*!
 * \file freetype_face.cpp
 * \brief file freetype_face.cpp
 *
 * Copyright 2016 by Intel.
 *
 * Contact: kevin.rogovin@intel.com
 *
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 * \author Kevin Rogovin <kevin.rogovin@intel.com>
 *
 */

#include <string>
#include <vector>
#include <fstream>
#include <iterator>
#include <coverdraw/text/freetype_face.hpp>
#include <coverdraw/util/log.hpp>
#include <private/util_private.hpp>

namespace
{
  class FreeTypeFacePrivate
  {
  public:
    FreeTypeFacePrivate(FT_Face pFace,
                        const coverdraw::reference_counted_ptr<coverdraw::FreeTypeLib> &pLib):
      m_face(pFace),
      m_lib(pLib)
    {}

    coverdraw::Mutex m_mutex;
    FT_Face m_face;
    coverdraw::reference_counted_ptr<coverdraw::FreeTypeLib> m_lib;
  };

  class GeneratorFilePrivate
  {
  public:
    GeneratorFilePrivate(coverdraw::c_string filename, int face_index):
      m_filename(filename),
      m_face_index(face_index)
    {}

    std::string m_filename;
    int m_face_index;
  };

  class GeneratorMemoryPrivate
  {
  public:
    GeneratorMemoryPrivate(coverdraw::c_array<const uint8_t> src, int face_index):
      m_bytes(src.begin(), src.end()),
      m_face_index(face_index)
    {}

    GeneratorMemoryPrivate(coverdraw::c_string filename, int face_index):
      m_face_index(face_index)
    {
      std::ifstream file(filename, std::ios::binary);
      if (file)
        {
          m_bytes.assign(std::istreambuf_iterator<char>(file),
                         std::istreambuf_iterator<char>());
        }
      else
        {
          COVERDRAWlog_warning("Unable to open font file \"" << filename << "\"");
        }
    }

    std::vector<uint8_t> m_bytes;
    int m_face_index;
  };
}

///////////////////////////////////////////////////////
// coverdraw::FreeTypeFace::GeneratorBase methods
coverdraw::reference_counted_ptr<coverdraw::FreeTypeFace>
coverdraw::FreeTypeFace::GeneratorBase::
create_face(reference_counted_ptr<FreeTypeLib> lib) const
{
  FT_Face face;
  reference_counted_ptr<FreeTypeFace> return_value;

  if (!lib)
    {
      lib = COVERDRAWnew FreeTypeLib();
    }

  if (!lib->valid())
    {
      return return_value;
    }

  {
    Mutex::Guard m(lib->mutex());
    face = create_face_implement(lib->lib());
  }

  if (face != nullptr && (face->face_flags & FT_FACE_FLAG_SCALABLE) == 0)
    {
      COVERDRAWlog_warning("FreeType face \"" << face->family_name
                           << "\" is not scalable");
      Mutex::Guard m(lib->mutex());
      FT_Done_Face(face);
      face = nullptr;
    }

  if (face != nullptr)
    {
      return_value = COVERDRAWnew FreeTypeFace(face, lib);
    }
  return return_value;
}

enum coverdraw::return_code
coverdraw::FreeTypeFace::GeneratorBase::
check_creation(reference_counted_ptr<FreeTypeLib> lib) const
{
  reference_counted_ptr<FreeTypeFace> face;

  face = create_face(lib);
  return (face) ? routine_success : routine_fail;
}

////////////////////////////////////////////////
// coverdraw::FreeTypeFace::GeneratorFile methods
coverdraw::FreeTypeFace::GeneratorFile::
GeneratorFile(c_string filename, int face_index)
{
  m_d = COVERDRAWnew GeneratorFilePrivate(filename, face_index);
}

coverdraw::FreeTypeFace::GeneratorFile::
~GeneratorFile()
{
  GeneratorFilePrivate *d;
  d = static_cast<GeneratorFilePrivate*>(m_d);
  COVERDRAWdelete(d);
}

FT_Face
coverdraw::FreeTypeFace::GeneratorFile::
create_face_implement(FT_Library lib) const
{
  GeneratorFilePrivate *d;
  FT_Error error_code;
  FT_Face face(nullptr);

  d = static_cast<GeneratorFilePrivate*>(m_d);
  error_code = FT_New_Face(lib, d->m_filename.c_str(), d->m_face_index, &face);
  if (error_code != 0)
    {
      COVERDRAWlog_warning("FT_New_Face failed on \"" << d->m_filename
                           << "\", face " << d->m_face_index
                           << " with error " << error_code);
      return nullptr;
    }
  return face;
}

//////////////////////////////////////////////////
// coverdraw::FreeTypeFace::GeneratorMemory methods
coverdraw::FreeTypeFace::GeneratorMemory::
GeneratorMemory(c_array<const uint8_t> src, int face_index)
{
  m_d = COVERDRAWnew GeneratorMemoryPrivate(src, face_index);
}

coverdraw::FreeTypeFace::GeneratorMemory::
GeneratorMemory(c_string filename, int face_index)
{
  m_d = COVERDRAWnew GeneratorMemoryPrivate(filename, face_index);
}

coverdraw::FreeTypeFace::GeneratorMemory::
~GeneratorMemory()
{
  GeneratorMemoryPrivate *d;
  d = static_cast<GeneratorMemoryPrivate*>(m_d);
  COVERDRAWdelete(d);
}

FT_Face
coverdraw::FreeTypeFace::GeneratorMemory::
create_face_implement(FT_Library lib) const
{
  GeneratorMemoryPrivate *d;
  FT_Error error_code;
  FT_Face face(nullptr);

  d = static_cast<GeneratorMemoryPrivate*>(m_d);
  if (d->m_bytes.empty())
    {
      return nullptr;
    }

  /* the bytes are owned by the generator, and FreeType
   * requires them to outlive the face
   */
  error_code = FT_New_Memory_Face(lib,
                                  static_cast<const FT_Byte*>(&d->m_bytes[0]),
                                  d->m_bytes.size(),
                                  d->m_face_index,
                                  &face);
  if (error_code != 0)
    {
      COVERDRAWlog_warning("FT_New_Memory_Face failed with error " << error_code);
      return nullptr;
    }
  return face;
}

///////////////////////////////////////////
// coverdraw::FreeTypeFace methods
coverdraw::FreeTypeFace::
FreeTypeFace(FT_Face pFace, const reference_counted_ptr<FreeTypeLib> &pLib)
{
  COVERDRAWassert(pFace != nullptr);
  COVERDRAWassert(pLib);
  m_d = COVERDRAWnew FreeTypeFacePrivate(pFace, pLib);
}

coverdraw::FreeTypeFace::
~FreeTypeFace()
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);

  {
    Mutex::Guard m(d->m_lib->mutex());
    FT_Done_Face(d->m_face);
  }

  COVERDRAWdelete(d);
}

FT_Face
coverdraw::FreeTypeFace::
face(void)
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  return d->m_face;
}

const coverdraw::reference_counted_ptr<coverdraw::FreeTypeLib>&
coverdraw::FreeTypeFace::
lib(void) const
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  return d->m_lib;
}

coverdraw::Mutex&
coverdraw::FreeTypeFace::
mutex(void)
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  return d->m_mutex;
}
