/*!
 * \file freetype_face.hpp
 * \brief file freetype_face.hpp
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


#pragma once

#include <ft2build.h>
#include FT_FREETYPE_H

#include <stdint.h>
#include <coverdraw/util/util.hpp>
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/mutex.hpp>
#include <coverdraw/text/freetype_lib.hpp>

namespace coverdraw
{
/*!\addtogroup Text
 * @{
 */
  /*!\brief
   * Reference counted owner of a scalable FT_Face.
   *
   * The FT_Face is created and released with the mutex of its
   * FreeTypeLib held; loading glyphs from it requires holding
   * mutex() of the FreeTypeFace.
   */
  class FreeTypeFace:public reference_counted<FreeTypeFace>::concurrent
  {
  public:
    /*!\brief
     * Source of FT_Face objects; FontFreeType creates its
     * face from one when constructed.
     */
    class GeneratorBase:public reference_counted<GeneratorBase>::concurrent
    {
    public:
      virtual
      ~GeneratorBase()
      {}

      /*!
       * Creates a FreeTypeFace, or returns nullptr (with a
       * logged warning) if the data does not give a scalable
       * face. If lib is nullptr a private FreeTypeLib is made
       * for the face.
       */
      reference_counted_ptr<FreeTypeFace>
      create_face(reference_counted_ptr<FreeTypeLib> lib
                  = reference_counted_ptr<FreeTypeLib>()) const;

      /*!
       * Creates and discards a face, returning routine_fail
       * if create_face() would return nullptr.
       */
      enum return_code
      check_creation(reference_counted_ptr<FreeTypeLib> lib
                     = reference_counted_ptr<FreeTypeLib>()) const;

    protected:
      /*!
       * Makes the FT_Face from lib, called with the mutex
       * of the FreeTypeLib held. Returns nullptr on failure.
       */
      virtual
      FT_Face
      create_face_implement(FT_Library lib) const = 0;
    };

    /*!
     * \brief Faces loaded with FT_New_Face from a font file.
     */
    class GeneratorFile:public GeneratorBase
    {
    public:
      GeneratorFile(c_string filename, int face_index);
      ~GeneratorFile();

    protected:
      virtual
      FT_Face
      create_face_implement(FT_Library lib) const;

    private:
      void *m_d;
    };

    /*!
     * \brief Faces loaded with FT_New_Memory_Face from bytes
     * owned by the generator.
     */
    class GeneratorMemory:public GeneratorBase
    {
    public:
      /*!
       * Copies src.
       */
      GeneratorMemory(c_array<const uint8_t> src, int face_index);

      /*!
       * Reads the whole of filename into memory; if the read
       * fails a warning is logged and every create_face() fails.
       */
      GeneratorMemory(c_string filename, int face_index);

      ~GeneratorMemory();

    protected:
      virtual
      FT_Face
      create_face_implement(FT_Library lib) const;

    private:
      void *m_d;
    };

    /*!
     * Takes ownership of pFace, which must have been made
     * from pLib; FT_Done_Face is called in the dtor.
     */
    FreeTypeFace(FT_Face pFace,
                 const reference_counted_ptr<FreeTypeLib> &pLib);

    ~FreeTypeFace();

    FT_Face
    face(void);

    const reference_counted_ptr<FreeTypeLib>&
    lib(void) const;

    /*!
     * Mutex to hold while loading glyphs from face(); an
     * FT_Face must not be used by two threads at once.
     */
    Mutex&
    mutex(void);

  private:
    void *m_d;
  };
/*! @} */
}
