#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, non-zero on error.
   spotmap::Error escapes to main(), which reports it. */

/* Load a points file and print its contents and export warnings.
   Example:
     spotmap-cli summary --points=session.csv */
int run_summary(int argc, char** argv);

/* Renumber ids 1..N and write the points back.
   Example:
     spotmap-cli renumber --points=session.csv --out=renumbered.csv */
int run_renumber(int argc, char** argv);

/* Delete one point by id.
   Example:
     spotmap-cli remove --points=session.csv --id=4 --out=session.csv */
int run_remove(int argc, char** argv);

/* Change one user-editable column of a point.
   Example:
     spotmap-cli edit --points=session.csv --id=4 --column=material --value=zircon */
int run_edit(int argc, char** argv);

/* Draw the points over an image and save it (PNG unless an extension is given).
   Example:
     spotmap-cli render --points=session.csv --image=scan.tif --save=overlay */
int run_render(int argc, char** argv);

/* Map the targets of an instrument report into this image.
   Example:
     spotmap-cli recoordinate --points=refs.csv --instrument=report.csv
                              --image=scan.png --out=session.csv */
int run_recoordinate(int argc, char** argv);

/* Pixels-per-micrometre ratio from a measured line.
   Example:
     spotmap-cli scale --from=10,10 --to=110,10 --microns=50 */
int run_scale(int argc, char** argv);
